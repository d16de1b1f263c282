#pragma once

#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

/** withdraws funds and moves them into the transaction
* balance making them available for deposit into a project
*/
struct withdraw_operation
{
    static const operation_type_enum type;

    withdraw_operation():amount(0){}

    withdraw_operation( const balance_id_type& id, share_type amount_arg )
        :balance_id(id),amount(amount_arg){}

    /** the balance to withdraw from; its owner must sign */
    balance_id_type    balance_id;
    share_type         amount;

    void evaluate( transaction_evaluation_state& eval_state )const;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::withdraw_operation, (balance_id)(amount) )
