#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/exceptions.hpp>

#include <fc/io/raw_variant.hpp>
#include <fc/reflect/variant.hpp>

namespace pifp { namespace blockchain {

   void chain_interface::set_chain_id( const digest_type& id )
   { try {
       store_property_record( property_id_type::chain_id, variant( id ) );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   digest_type chain_interface::get_chain_id()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::chain_id );
       FC_ASSERT( record.valid(), "ledger has not been initialized" );
       return record->value.as<digest_type>();
   } FC_CAPTURE_AND_RETHROW() }

   project_id_type chain_interface::last_project_id()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::last_project_id );
       if( !record.valid() ) return 0;
       return record->value.as<project_id_type>();
   } FC_CAPTURE_AND_RETHROW() }

   project_id_type chain_interface::new_project_id()
   { try {
       const project_id_type next_id = last_project_id() + 1;
       store_property_record( property_id_type::last_project_id, variant( next_id ) );
       return next_id;
   } FC_CAPTURE_AND_RETHROW() }

   uint64_t chain_interface::get_authority_version()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::authority_version );
       if( !record.valid() ) return 0;
       return record->value.as_uint64();
   } FC_CAPTURE_AND_RETHROW() }

   uint64_t chain_interface::bump_authority_version()
   { try {
       const uint64_t version = get_authority_version() + 1;
       store_property_record( property_id_type::authority_version, variant( version ) );
       return version;
   } FC_CAPTURE_AND_RETHROW() }

   uint16_t chain_interface::get_protocol_fee_bps()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::protocol_fee_bps );
       if( !record.valid() ) return 0;
       return record->value.as<uint16_t>();
   } FC_CAPTURE_AND_RETHROW() }

   optional<address> chain_interface::get_fee_collector()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::fee_collector );
       if( !record.valid() ) return optional<address>();
       return record->value.as<address>();
   } FC_CAPTURE_AND_RETHROW() }

   optional<address> chain_interface::get_super_admin()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::super_admin );
       if( !record.valid() ) return optional<address>();
       return record->value.as<address>();
   } FC_CAPTURE_AND_RETHROW() }

   oproperty_record chain_interface::get_property_record( const property_id_type id )const
   { try {
       return lookup<property_record>( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   void chain_interface::store_property_record( const property_id_type id, const variant& value )
   { try {
       store( id, property_record{ id, value } );
   } FC_CAPTURE_AND_RETHROW( (id)(value) ) }

   oproject_record chain_interface::get_project_record( const project_id_type id )const
   { try {
       return lookup<project_record>( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   void chain_interface::store_project_record( const project_record& record )
   { try {
       store( record.id, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   odonation_record chain_interface::get_donation_record( const donation_index& index )const
   { try {
       return lookup<donation_record>( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void chain_interface::store_donation_record( const donation_record& record )
   { try {
       store( record.index, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   oproof_record chain_interface::get_proof_record( const proof_index& index )const
   { try {
       return lookup<proof_record>( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void chain_interface::store_proof_record( const proof_record& record )
   { try {
       store( record.index, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   oattestation_record chain_interface::get_attestation_record( const proof_index& index )const
   { try {
       return lookup<attestation_record>( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void chain_interface::store_attestation_record( const attestation_record& record )
   { try {
       store( record.proof, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   obalance_record chain_interface::get_balance_record( const balance_id_type& id )const
   { try {
       return lookup<balance_record>( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   void chain_interface::store_balance_record( const balance_record& record )
   { try {
       store( record.id(), record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   orole_record chain_interface::get_role_record( const address& holder )const
   { try {
       return lookup<role_record>( holder );
   } FC_CAPTURE_AND_RETHROW( (holder) ) }

   void chain_interface::store_role_record( const role_record& record )
   { try {
       store( record.holder, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   void chain_interface::remove_role_record( const address& holder )
   { try {
       remove<role_record>( holder );
   } FC_CAPTURE_AND_RETHROW( (holder) ) }

   role_type chain_interface::get_role( const address& holder )const
   { try {
       const orole_record record = get_role_record( holder );
       if( !record.valid() ) return no_role;
       return record->role;
   } FC_CAPTURE_AND_RETHROW( (holder) ) }

   bool chain_interface::has_role( const address& holder, role_type role )const
   { try {
       return role != no_role && get_role( holder ) == role;
   } FC_CAPTURE_AND_RETHROW( (holder)(role) ) }

   otransaction_record chain_interface::get_transaction( const transaction_id_type& trx_id )const
   { try {
       return lookup<transaction_record>( trx_id );
   } FC_CAPTURE_AND_RETHROW( (trx_id) ) }

   void chain_interface::store_transaction( const transaction_id_type& trx_id, const transaction_record& record )
   { try {
       store( trx_id, record );
   } FC_CAPTURE_AND_RETHROW( (trx_id)(record) ) }

} } // pifp::blockchain
