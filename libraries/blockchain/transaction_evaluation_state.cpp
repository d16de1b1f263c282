#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/operation_factory.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   bool transaction_evaluation_state::check_signature( const address& a )const
   { try {
      return signed_addresses.find( a ) != signed_addresses.end();
   } FC_CAPTURE_AND_RETHROW( (a) ) }

   bool transaction_evaluation_state::is_settlement_only( const transaction& trx )
   {
      for( const auto& op : trx.operations )
      {
         const operation_type_enum type = (operation_type_enum)op.type;
         if( type != attest_proof_op_type && type != release_op_type )
            return false;
      }
      return !trx.operations.empty();
   }

   void transaction_evaluation_state::evaluate( const signed_transaction& trx_arg )
   { try {
      trx = trx_arg;
      try {
        const time_point_sec now = pending_state()->now();
        if( now >= trx_arg.expiration )
        {
           const auto expired_by_sec = (now - trx_arg.expiration).to_seconds();
           FC_CAPTURE_AND_THROW( expired_transaction, (trx_arg)(now)(expired_by_sec) );
        }
        if( (now + PIFP_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC) < trx_arg.expiration )
           FC_CAPTURE_AND_THROW( invalid_transaction_expiration, (trx_arg)(now) );

        if( trx_arg.operations.size() > PIFP_BLOCKCHAIN_MAX_OPERATIONS_PER_TRANSACTION )
           FC_CAPTURE_AND_THROW( oversized_transaction, (trx_arg.operations.size()) );

        // a replayed settlement fails with already_settled or releases nothing
        replayed = pending_state()->is_known_transaction( trx_arg );
        if( replayed && !is_settlement_only( trx_arg ) )
           FC_CAPTURE_AND_THROW( duplicate_transaction, (trx.id()) );

        const auto trx_digest = trx_arg.digest( pending_state()->get_chain_id() );
        for( const auto& sig : trx_arg.signatures )
        {
           const auto key = fc::ecc::public_key( sig, trx_digest, true );
           signed_addresses.insert( address( key ) );
        }

        for( const auto& op : trx_arg.operations )
           evaluate_operation( op );

        if( balance != 0 )
           FC_CAPTURE_AND_THROW( unbalanced_transaction, (balance) );

        if( replayed )
        {
           FC_ASSERT( events.empty(), "replayed transaction changed the ledger", ("events",events) );
           return;
        }

        pending_state()->store_transaction( trx.id(), transaction_record( trx, events, now ) );
      }
      catch ( const fc::exception& e )
      {
         validation_error = e;
         throw;
      }
   } FC_CAPTURE_AND_RETHROW( (trx_arg) ) }

   void transaction_evaluation_state::evaluate_operation( const operation& op )
   { try {
      operation_factory::instance().evaluate( *this, op );
   } FC_CAPTURE_AND_RETHROW( (op) ) }

   void transaction_evaluation_state::sub_balance( share_type amount )
   { try {
      if( amount > balance )
         FC_CAPTURE_AND_THROW( insufficient_funds, (amount)(balance) );
      balance -= amount;
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void transaction_evaluation_state::add_balance( share_type amount )
   { try {
      if( balance > PIFP_BLOCKCHAIN_MAX_SHARES - amount )
         FC_CAPTURE_AND_THROW( addition_overflow, (balance)(amount) );
      balance += amount;
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void transaction_evaluation_state::emit( event_record event )
   {
      event.timestamp = pending_state()->now();
      event.transaction_id = trx.id();
      events.push_back( std::move( event ) );
   }

} } // pifp::blockchain
