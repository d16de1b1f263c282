#pragma once

#include <pifp/blockchain/event_record.hpp>
#include <pifp/blockchain/transaction.hpp>
#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

class pending_chain_state;
typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

/**
*  While evaluating a transaction there is a lot of intermediate
*  state that must be tracked.  Any shares withdrawn from a balance
*  are held in the transaction state until an operation locks them
*  into a project; a transaction that leaves shares behind is rejected.
*
*  Events are collected here and only become visible once every
*  operation of the transaction has been applied.
*/
struct transaction_evaluation_state
{
    transaction_evaluation_state( pending_chain_state_ptr pending_state = nullptr ) : _pending_state( pending_state ) {}

    pending_chain_state* pending_state()const
    {
        const pending_chain_state_ptr ptr = _pending_state.lock();
        FC_ASSERT( ptr );
        return ptr.get();
    }

    void evaluate( const signed_transaction& trx );
    void evaluate_operation( const operation& op );

    bool check_signature( const address& a )const;

    /** true when trx consists of attestations and releases only */
    static bool is_settlement_only( const transaction& trx );

    void add_balance( share_type amount );
    void sub_balance( share_type amount );

    /** stamps the event with the evaluation time and the transaction id */
    void emit( event_record event );

    signed_transaction                             trx;
    set<address>                                   signed_addresses;

    /** shares withdrawn but not yet deposited */
    share_type                                     balance = 0;

    event_records                                  events;

    optional<fc::exception>                        validation_error;

    /** an already applied transaction whose operations were evaluated again without effect */
    bool                                           replayed = false;

private:
    std::weak_ptr<pending_chain_state>             _pending_state;
};
typedef shared_ptr<transaction_evaluation_state> transaction_evaluation_state_ptr;

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::transaction_evaluation_state,
            (trx)
            (signed_addresses)
            (balance)
            (events)
            (validation_error)
            (replayed)
            )
