#include <pifp/blockchain/chain_database.hpp>
#include <pifp/blockchain/chain_database_impl.hpp>
#include <pifp/blockchain/config.hpp>
#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/time.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

#include <fc/io/json.hpp>
#include <fc/io/raw_variant.hpp>
#include <fc/thread/unique_lock.hpp>

namespace pifp { namespace blockchain {

   namespace detail
   {
      void chain_database_impl::open_database( const fc::path& data_dir )
      { try {
          _property_id_to_record.open( data_dir / "index/property_id_to_record" );

          _project_id_to_record.open( data_dir / "index/project_id_to_record" );
          _donation_index_to_record.open( data_dir / "index/donation_index_to_record" );
          _proof_index_to_record.open( data_dir / "index/proof_index_to_record" );
          _attestation_proof_to_record.open( data_dir / "index/attestation_proof_to_record" );

          _balance_id_to_record.open( data_dir / "index/balance_id_to_record" );
          _role_holder_to_record.open( data_dir / "index/role_holder_to_record" );

          _transaction_id_to_record.open( data_dir / "index/transaction_id_to_record" );
          _transaction_digest_to_id.open( data_dir / "index/transaction_digest_to_id" );

          _event_sequence_to_record.open( data_dir / "index/event_sequence_to_record" );

          event_record last_event;
          if( !_event_sequence_to_record.last( _last_event_sequence, last_event ) )
             _last_event_sequence = 0;
      } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

      void chain_database_impl::initialize_genesis( const genesis_state& genesis )
      { try {
         if( genesis.super_admin.is_null() )
            FC_CAPTURE_AND_THROW( invalid_genesis, (genesis.super_admin) );

         if( genesis.protocol_fee_bps > PIFP_BLOCKCHAIN_MAX_PROTOCOL_FEE_BPS )
            FC_CAPTURE_AND_THROW( invalid_genesis, (genesis.protocol_fee_bps) );

         if( genesis.protocol_fee_bps > 0 && !genesis.fee_collector.valid() )
            FC_CAPTURE_AND_THROW( invalid_genesis, (genesis.protocol_fee_bps)(genesis.fee_collector) );

         fc::sha256::encoder enc;
         fc::raw::pack( enc, genesis );
         const digest_type chain_id = enc.result();

         self->store_property_record( property_id_type::database_version, variant( PIFP_BLOCKCHAIN_DATABASE_VERSION ) );
         self->set_chain_id( chain_id );
         self->store_property_record( property_id_type::super_admin, variant( genesis.super_admin ) );
         self->store_property_record( property_id_type::protocol_fee_bps, variant( genesis.protocol_fee_bps ) );
         if( genesis.fee_collector.valid() )
            self->store_property_record( property_id_type::fee_collector, variant( *genesis.fee_collector ) );

         const auto store_genesis_role = [&]( const address& holder, role_type role )
         {
            role_record record;
            record.holder = holder;
            record.role = role;
            record.granted_by = genesis.super_admin;
            record.granted_at = genesis.timestamp;
            record.authority_version = self->bump_authority_version();
            self->store_role_record( record );
         };

         store_genesis_role( genesis.super_admin, super_admin_role );
         for( const address& oracle : genesis.oracles )
         {
            if( oracle == genesis.super_admin )
               FC_CAPTURE_AND_THROW( invalid_genesis, (oracle) );
            store_genesis_role( oracle, oracle_role );
         }

         for( const genesis_balance& item : genesis.initial_balances )
         {
            if( item.balance <= 0 )
               FC_CAPTURE_AND_THROW( invalid_genesis, (item.owner)(item.balance) );

            balance_record initial_balance( item.owner );

            /* In case of redundant balances */
            const obalance_record cur = self->get_balance_record( item.owner );
            if( cur.valid() ) initial_balance.balance = cur->balance;

            initial_balance.balance += item.balance;
            initial_balance.last_update = genesis.timestamp;
            self->store_balance_record( initial_balance );
         }

         ilog( "initialized ledger ${id} with ${oracles} oracles and ${balances} balances",
               ("id",chain_id)("oracles",genesis.oracles.size())("balances",genesis.initial_balances.size()) );
      } FC_CAPTURE_AND_RETHROW( (genesis) ) }

      void chain_database_impl::journal_events( transaction_record& record )
      {
         uint64_t sequence = _last_event_sequence;
         for( event_record& event : record.events )
            event.sequence = ++sequence;
      }

      void chain_database_impl::notify_observers( const transaction_record& record )const
      {
         for( chain_observer* o : _observers )
         {
            try
            {
               for( const event_record& event : record.events )
                  o->event_emitted( event );
               o->transaction_applied( record );
            }
            catch( const fc::exception& e )
            {
               elog( "chain observer failed on transaction ${id}: ${e}", ("id",record.trx.id())("e",e.to_detail_string()) );
            }
         }
      }

  } // detail

   chain_database::chain_database()
   :my( new detail::chain_database_impl() )
   {
      my->self = this;
   }

   chain_database::~chain_database()
   {
      try
      {
         close();
      }
      catch( const fc::exception& e )
      {
         elog( "unexpected exception closing database\n ${e}", ("e",e.to_detail_string() ) );
      }
   }

   void chain_database::open( const fc::path& data_dir, const genesis_state& genesis )
   { try {
      my->open_database( data_dir );

      if( !get_property_record( property_id_type::chain_id ).valid() )
      {
         try
         {
            my->initialize_genesis( genesis );
         }
         catch( const fc::exception& e )
         {
            elog( "Error initializing database from genesis: ${e}", ("e",e.to_detail_string()) );
            close();
            fc::remove_all( data_dir / "index" );
            throw;
         }
      }
      else
      {
         const oproperty_record version = get_property_record( property_id_type::database_version );
         FC_ASSERT( version.valid() && version->value.as_uint64() == PIFP_BLOCKCHAIN_DATABASE_VERSION,
                    "unsupported database version", ("version",version) );
         ilog( "opened existing ledger ${id}, genesis ignored", ("id",get_chain_id()) );
      }
   } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

   void chain_database::open( const fc::path& data_dir, const fc::optional<fc::path>& genesis_file )
   { try {
      genesis_state genesis;
      if( genesis_file.valid() )
      {
         FC_ASSERT( fc::exists( *genesis_file ), "Genesis file '${file}' was not found.", ("file", *genesis_file) );
         genesis = fc::json::from_file( *genesis_file ).as<genesis_state>();
      }
      else
      {
         my->open_database( data_dir );
         const bool initialized = get_property_record( property_id_type::chain_id ).valid();
         close();
         if( !initialized )
            FC_THROW_EXCEPTION( invalid_genesis, "a genesis file is required to initialize ${dir}", ("dir",data_dir) );
      }
      open( data_dir, genesis );
   } FC_CAPTURE_AND_RETHROW( (data_dir)(genesis_file) ) }

   void chain_database::close()
   { try {
      my->_property_id_to_record.close();

      my->_project_id_to_record.close();
      my->_donation_index_to_record.close();
      my->_proof_index_to_record.close();
      my->_attestation_proof_to_record.close();

      my->_balance_id_to_record.close();
      my->_role_holder_to_record.close();

      my->_transaction_id_to_record.close();
      my->_transaction_digest_to_id.close();

      my->_event_sequence_to_record.close();
   } FC_CAPTURE_AND_RETHROW() }

   bool chain_database::is_open()const
   {
      return my->_property_id_to_record.is_open();
   }

   void chain_database::add_observer( chain_observer* observer )
   {
      my->_observers.insert(observer);
   }

   void chain_database::remove_observer( chain_observer* observer )
   {
      my->_observers.erase(observer);
   }

   transaction_evaluation_state_ptr chain_database::evaluate_transaction( const signed_transaction& trx )
   { try {
      pending_chain_state_ptr          pend_state = std::make_shared<pending_chain_state>( shared_from_this() );
      transaction_evaluation_state_ptr trx_eval_state = std::make_shared<transaction_evaluation_state>( pend_state );

      trx_eval_state->evaluate( trx );
      return trx_eval_state;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   transaction_evaluation_state_ptr chain_database::push_transaction( const signed_transaction& trx )
   { try {
      // mutations are applied one transaction at a time
      fc::unique_lock<fc::mutex> lock( my->_push_transaction_mutex );

      pending_chain_state_ptr          pend_state = std::make_shared<pending_chain_state>( shared_from_this() );
      transaction_evaluation_state_ptr trx_eval_state = std::make_shared<transaction_evaluation_state>( pend_state );

      trx_eval_state->evaluate( trx );

      const transaction_id_type trx_id = trx.id();
      if( trx_eval_state->replayed )
      {
         ilog( "transaction ${id} replays settled operations, nothing applied", ("id",trx_id) );
         return trx_eval_state;
      }

      transaction_record& record = pend_state->_transaction_id_to_record.at( trx_id );
      my->journal_events( record );
      trx_eval_state->events = record.events;

      pend_state->apply_changes();

      for( const event_record& event : record.events )
      {
         my->_event_sequence_to_record.store( event.sequence, event );
         my->_last_event_sequence = event.sequence;
      }

      ilog( "applied transaction ${id} with ${n} operations", ("id",trx_id)("n",trx.operations.size()) );
      my->notify_observers( record );
      return trx_eval_state;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   fc::time_point_sec chain_database::now()const
   {
      return blockchain::now();
   }

   bool chain_database::is_known_transaction( const transaction& trx )const
   { try {
      return my->_transaction_digest_to_id.fetch_optional( trx.digest( get_chain_id() ) ).valid();
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   oproject_record chain_database::get_project( project_id_type id )const
   { try {
      return get_project_record( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   vector<project_record> chain_database::get_projects( project_id_type first, uint32_t limit )const
   { try {
      vector<project_record> projects;
      for( auto itr = my->_project_id_to_record.lower_bound( first ); itr.valid() && projects.size() < limit; ++itr )
         projects.push_back( itr.value() );
      return projects;
   } FC_CAPTURE_AND_RETHROW( (first)(limit) ) }

   vector<donation_record> chain_database::get_donations( project_id_type id )const
   { try {
      vector<donation_record> donations;
      for( auto itr = my->_donation_index_to_record.lower_bound( donation_index( id, 0 ) ); itr.valid(); ++itr )
      {
         if( itr.key().project_id != id ) break;
         donations.push_back( itr.value() );
      }
      return donations;
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   vector<proof_record> chain_database::get_proofs( project_id_type id )const
   { try {
      vector<proof_record> proofs;
      for( auto itr = my->_proof_index_to_record.lower_bound( proof_index( id, 0 ) ); itr.valid(); ++itr )
      {
         if( itr.key().project_id != id ) break;
         proofs.push_back( itr.value() );
      }
      return proofs;
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   oattestation_record chain_database::get_attestation( const proof_index& proof )const
   { try {
      return get_attestation_record( proof );
   } FC_CAPTURE_AND_RETHROW( (proof) ) }

   share_type chain_database::get_balance( const address& owner )const
   { try {
      const obalance_record record = get_balance_record( owner );
      if( !record.valid() ) return 0;
      return record->balance;
   } FC_CAPTURE_AND_RETHROW( (owner) ) }

   vector<event_record> chain_database::get_events( uint64_t after_sequence, uint32_t limit )const
   { try {
      vector<event_record> events;
      for( auto itr = my->_event_sequence_to_record.lower_bound( after_sequence + 1 ); itr.valid() && events.size() < limit; ++itr )
         events.push_back( itr.value() );
      return events;
   } FC_CAPTURE_AND_RETHROW( (after_sequence)(limit) ) }

   uint64_t chain_database::last_event_sequence()const
   {
      return my->_last_event_sequence;
   }

   oproperty_record chain_database::property_lookup_by_id( const property_id_type id )const
   {
       return my->_property_id_to_record.fetch_optional( static_cast<uint8_t>( id ) );
   }

   void chain_database::property_insert_into_id_map( const property_id_type id, const property_record& record )
   {
       my->_property_id_to_record.store( static_cast<uint8_t>( id ), record );
   }

   void chain_database::property_erase_from_id_map( const property_id_type id )
   {
       my->_property_id_to_record.remove( static_cast<uint8_t>( id ) );
   }

   oproject_record chain_database::project_lookup_by_id( const project_id_type id )const
   {
       return my->_project_id_to_record.fetch_optional( id );
   }

   void chain_database::project_insert_into_id_map( const project_id_type id, const project_record& record )
   {
       my->_project_id_to_record.store( id, record );
   }

   void chain_database::project_erase_from_id_map( const project_id_type id )
   {
       my->_project_id_to_record.remove( id );
   }

   odonation_record chain_database::donation_lookup_by_index( const donation_index& index )const
   {
       return my->_donation_index_to_record.fetch_optional( index );
   }

   void chain_database::donation_insert_into_index_map( const donation_index& index, const donation_record& record )
   {
       my->_donation_index_to_record.store( index, record );
   }

   void chain_database::donation_erase_from_index_map( const donation_index& index )
   {
       my->_donation_index_to_record.remove( index );
   }

   oproof_record chain_database::proof_lookup_by_index( const proof_index& index )const
   {
       return my->_proof_index_to_record.fetch_optional( index );
   }

   void chain_database::proof_insert_into_index_map( const proof_index& index, const proof_record& record )
   {
       my->_proof_index_to_record.store( index, record );
   }

   void chain_database::proof_erase_from_index_map( const proof_index& index )
   {
       my->_proof_index_to_record.remove( index );
   }

   oattestation_record chain_database::attestation_lookup_by_proof( const proof_index& index )const
   {
       return my->_attestation_proof_to_record.fetch_optional( index );
   }

   void chain_database::attestation_insert_into_proof_map( const proof_index& index, const attestation_record& record )
   {
       my->_attestation_proof_to_record.store( index, record );
   }

   void chain_database::attestation_erase_from_proof_map( const proof_index& index )
   {
       my->_attestation_proof_to_record.remove( index );
   }

   obalance_record chain_database::balance_lookup_by_id( const balance_id_type& id )const
   {
       return my->_balance_id_to_record.fetch_optional( id );
   }

   void chain_database::balance_insert_into_id_map( const balance_id_type& id, const balance_record& record )
   {
       my->_balance_id_to_record.store( id, record );
   }

   void chain_database::balance_erase_from_id_map( const balance_id_type& id )
   {
       my->_balance_id_to_record.remove( id );
   }

   orole_record chain_database::role_lookup_by_holder( const address& holder )const
   {
       return my->_role_holder_to_record.fetch_optional( holder );
   }

   void chain_database::role_insert_into_holder_map( const address& holder, const role_record& record )
   {
       my->_role_holder_to_record.store( holder, record );
   }

   void chain_database::role_erase_from_holder_map( const address& holder )
   {
       my->_role_holder_to_record.remove( holder );
   }

   otransaction_record chain_database::transaction_lookup_by_id( const transaction_id_type& id )const
   {
       return my->_transaction_id_to_record.fetch_optional( id );
   }

   void chain_database::transaction_insert_into_id_map( const transaction_id_type& id, const transaction_record& record )
   {
       my->_transaction_id_to_record.store( id, record );
       my->_transaction_digest_to_id.store( record.trx.digest( get_chain_id() ), id );
   }

   void chain_database::transaction_erase_from_id_map( const transaction_id_type& id )
   {
       const otransaction_record record = my->_transaction_id_to_record.fetch_optional( id );
       if( record.valid() )
          my->_transaction_digest_to_id.remove( record->trx.digest( get_chain_id() ) );
       my->_transaction_id_to_record.remove( id );
   }

} } // pifp::blockchain
