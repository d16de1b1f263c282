#pragma once

#include <pifp/blockchain/commitment.hpp>
#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/project_record.hpp>

namespace pifp { namespace blockchain {

/**
 *  Pays a completed project to its implementer.  A project is paid at most once;
 *  releasing an already settled project is a no-op.
 */
struct release_operation
{
    static const operation_type_enum type;

    release_operation(){}
    explicit release_operation( project_id_type pid ):project_id(pid){}

    project_id_type     project_id = 0;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/**
 *  Returns one donation of an expired project to the donor who can open its
 *  commitment.  The revealed secret names the donor address, which must sign.
 */
struct refund_operation
{
    static const operation_type_enum type;

    project_id_type     project_id = 0;
    donation_id_type    donation_id = 0;
    commitment_secret   secret;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/**
 *  Settles a completed project: credits the implementer with the funded amount
 *  less the protocol fee, marks every donation released and sets the settled flag.
 *  Returns false without changing anything when the project was already settled.
 */
bool release_project_funds( transaction_evaluation_state& eval_state, project_record& project );

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::release_operation, (project_id) )
FC_REFLECT( pifp::blockchain::refund_operation, (project_id)(donation_id)(secret) )
