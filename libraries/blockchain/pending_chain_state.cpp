#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/time.hpp>

namespace pifp { namespace blockchain {

   pending_chain_state::pending_chain_state( chain_interface_ptr prev_state )
   : _prev_state( prev_state )
   {
   }

   bool pending_chain_state::is_known_transaction( const transaction& trx )const
   { try {
       if( _transaction_digests.count( trx.digest( get_chain_id() ) ) > 0 ) return true;
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( prev_state ) return prev_state->is_known_transaction( trx );
       return false;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   fc::time_point_sec pending_chain_state::now()const
   {
      const chain_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return blockchain::now();
      return prev_state->now();
   }

   void pending_chain_state::apply_changes()const
   { try {
      const chain_interface_ptr prev_state = _prev_state.lock();
      FC_ASSERT( prev_state, "pending state has no parent to apply changes to" );

      // projects before the donation and proof records whose sanity checks refer to them
      apply_records( prev_state, _property_id_to_record, _property_id_remove );
      apply_records( prev_state, _project_id_to_record, _project_id_remove );
      apply_records( prev_state, _donation_index_to_record, _donation_index_remove );
      apply_records( prev_state, _proof_index_to_record, _proof_index_remove );
      apply_records( prev_state, _attestation_proof_to_record, _attestation_proof_remove );
      apply_records( prev_state, _balance_id_to_record, _balance_id_remove );
      apply_records( prev_state, _role_holder_to_record, _role_holder_remove );
      apply_records( prev_state, _transaction_id_to_record, _transaction_id_remove );
   } FC_CAPTURE_AND_RETHROW() }

   oproperty_record pending_chain_state::property_lookup_by_id( const property_id_type id )const
   {
       return lookup_record<property_record>( _property_id_to_record, _property_id_remove, id );
   }

   void pending_chain_state::property_insert_into_id_map( const property_id_type id, const property_record& record )
   {
       insert_record( _property_id_to_record, _property_id_remove, id, record );
   }

   void pending_chain_state::property_erase_from_id_map( const property_id_type id )
   {
       erase_record( _property_id_to_record, _property_id_remove, id );
   }

   oproject_record pending_chain_state::project_lookup_by_id( const project_id_type id )const
   {
       return lookup_record<project_record>( _project_id_to_record, _project_id_remove, id );
   }

   void pending_chain_state::project_insert_into_id_map( const project_id_type id, const project_record& record )
   {
       insert_record( _project_id_to_record, _project_id_remove, id, record );
   }

   void pending_chain_state::project_erase_from_id_map( const project_id_type id )
   {
       erase_record( _project_id_to_record, _project_id_remove, id );
   }

   odonation_record pending_chain_state::donation_lookup_by_index( const donation_index& index )const
   {
       return lookup_record<donation_record>( _donation_index_to_record, _donation_index_remove, index );
   }

   void pending_chain_state::donation_insert_into_index_map( const donation_index& index, const donation_record& record )
   {
       insert_record( _donation_index_to_record, _donation_index_remove, index, record );
   }

   void pending_chain_state::donation_erase_from_index_map( const donation_index& index )
   {
       erase_record( _donation_index_to_record, _donation_index_remove, index );
   }

   oproof_record pending_chain_state::proof_lookup_by_index( const proof_index& index )const
   {
       return lookup_record<proof_record>( _proof_index_to_record, _proof_index_remove, index );
   }

   void pending_chain_state::proof_insert_into_index_map( const proof_index& index, const proof_record& record )
   {
       insert_record( _proof_index_to_record, _proof_index_remove, index, record );
   }

   void pending_chain_state::proof_erase_from_index_map( const proof_index& index )
   {
       erase_record( _proof_index_to_record, _proof_index_remove, index );
   }

   oattestation_record pending_chain_state::attestation_lookup_by_proof( const proof_index& index )const
   {
       return lookup_record<attestation_record>( _attestation_proof_to_record, _attestation_proof_remove, index );
   }

   void pending_chain_state::attestation_insert_into_proof_map( const proof_index& index, const attestation_record& record )
   {
       insert_record( _attestation_proof_to_record, _attestation_proof_remove, index, record );
   }

   void pending_chain_state::attestation_erase_from_proof_map( const proof_index& index )
   {
       erase_record( _attestation_proof_to_record, _attestation_proof_remove, index );
   }

   obalance_record pending_chain_state::balance_lookup_by_id( const balance_id_type& id )const
   {
       return lookup_record<balance_record>( _balance_id_to_record, _balance_id_remove, id );
   }

   void pending_chain_state::balance_insert_into_id_map( const balance_id_type& id, const balance_record& record )
   {
       insert_record( _balance_id_to_record, _balance_id_remove, id, record );
   }

   void pending_chain_state::balance_erase_from_id_map( const balance_id_type& id )
   {
       erase_record( _balance_id_to_record, _balance_id_remove, id );
   }

   orole_record pending_chain_state::role_lookup_by_holder( const address& holder )const
   {
       return lookup_record<role_record>( _role_holder_to_record, _role_holder_remove, holder );
   }

   void pending_chain_state::role_insert_into_holder_map( const address& holder, const role_record& record )
   {
       insert_record( _role_holder_to_record, _role_holder_remove, holder, record );
   }

   void pending_chain_state::role_erase_from_holder_map( const address& holder )
   {
       erase_record( _role_holder_to_record, _role_holder_remove, holder );
   }

   otransaction_record pending_chain_state::transaction_lookup_by_id( const transaction_id_type& id )const
   {
       return lookup_record<transaction_record>( _transaction_id_to_record, _transaction_id_remove, id );
   }

   void pending_chain_state::transaction_insert_into_id_map( const transaction_id_type& id, const transaction_record& record )
   {
       insert_record( _transaction_id_to_record, _transaction_id_remove, id, record );
       _transaction_digests.insert( record.trx.digest( get_chain_id() ) );
   }

   void pending_chain_state::transaction_erase_from_id_map( const transaction_id_type& id )
   {
       erase_record( _transaction_id_to_record, _transaction_id_remove, id );
   }

} } // pifp::blockchain
