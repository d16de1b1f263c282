#include <pifp/blockchain/balance_operations.hpp>
#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   void withdraw_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( this->amount <= 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );

      obalance_record current_balance_record = eval_state.pending_state()->get_balance_record( this->balance_id );
      if( !current_balance_record.valid() )
         FC_CAPTURE_AND_THROW( unknown_balance_record, (balance_id) );

      if( !eval_state.check_signature( current_balance_record->owner ) )
         FC_CAPTURE_AND_THROW( missing_signature, (current_balance_record->owner) );

      if( this->amount > current_balance_record->balance )
         FC_CAPTURE_AND_THROW( insufficient_funds, (current_balance_record->balance)(amount) );

      current_balance_record->balance -= this->amount;
      current_balance_record->last_update = eval_state.pending_state()->now();
      eval_state.pending_state()->store_balance_record( *current_balance_record );

      eval_state.add_balance( this->amount );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pifp::blockchain
