#pragma once

#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

/**
 *  Creates a project in the funding state.  The creator must sign and hold a
 *  role that may register projects.
 */
struct register_project_operation
{
    static const operation_type_enum type;

    address             creator;
    /** payout address, the creator when left null */
    address             implementer;
    share_type          target = 0;
    time_point_sec      deadline;
    digest_type         proof_schema_hash;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/**
 *  Locks funds from the transaction balance into a project.  The donor stays
 *  anonymous on-chain; only the commitment to (donor, amount, nonce) is stored.
 */
struct deposit_operation
{
    static const operation_type_enum type;

    deposit_operation(){}
    deposit_operation( project_id_type pid, share_type amnt, const commitment_type& commitment )
        :project_id(pid),amount(amnt),donor_commitment(commitment){}

    project_id_type     project_id = 0;
    share_type          amount = 0;
    commitment_type     donor_commitment;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/** signed by the implementer; the payload itself goes to the oracle */
struct submit_proof_operation
{
    static const operation_type_enum type;

    project_id_type     project_id = 0;
    commitment_type     proof_commitment;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

/** may be included by anyone, the outcome depends only on the ledger clock */
struct check_expiry_operation
{
    static const operation_type_enum type;

    check_expiry_operation(){}
    explicit check_expiry_operation( project_id_type pid ):project_id(pid){}

    project_id_type     project_id = 0;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::register_project_operation, (creator)(implementer)(target)(deadline)(proof_schema_hash) )
FC_REFLECT( pifp::blockchain::deposit_operation, (project_id)(amount)(donor_commitment) )
FC_REFLECT( pifp::blockchain::submit_proof_operation, (project_id)(proof_commitment) )
FC_REFLECT( pifp::blockchain::check_expiry_operation, (project_id) )
