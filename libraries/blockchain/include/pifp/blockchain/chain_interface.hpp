#pragma once

#include <pifp/blockchain/attestation_record.hpp>
#include <pifp/blockchain/balance_record.hpp>
#include <pifp/blockchain/config.hpp>
#include <pifp/blockchain/donation_record.hpp>
#include <pifp/blockchain/project_record.hpp>
#include <pifp/blockchain/proof_record.hpp>
#include <pifp/blockchain/property_record.hpp>
#include <pifp/blockchain/role_record.hpp>
#include <pifp/blockchain/transaction_record.hpp>
#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

   class chain_interface
   : public property_db_interface,
     public project_db_interface,
     public donation_db_interface,
     public proof_db_interface,
     public attestation_db_interface,
     public balance_db_interface,
     public role_db_interface,
     public transaction_db_interface
   {
      public:
         virtual ~chain_interface(){};

         virtual fc::time_point_sec         now()const = 0;

         void                               set_chain_id( const digest_type& id );
         digest_type                        get_chain_id()const;

         project_id_type                    last_project_id()const;
         project_id_type                    new_project_id();

         /** incremented by every change to the role table */
         uint64_t                           get_authority_version()const;
         uint64_t                           bump_authority_version();

         uint16_t                           get_protocol_fee_bps()const;
         optional<address>                  get_fee_collector()const;
         optional<address>                  get_super_admin()const;

         /** matches trx by its unsigned digest, whatever signatures it carries */
         virtual bool                       is_known_transaction( const transaction& trx )const = 0;

         oproperty_record                   get_property_record( const property_id_type id )const;
         void                               store_property_record( const property_id_type id, const variant& value );

         oproject_record                    get_project_record( const project_id_type id )const;
         void                               store_project_record( const project_record& record );

         odonation_record                   get_donation_record( const donation_index& index )const;
         void                               store_donation_record( const donation_record& record );

         oproof_record                      get_proof_record( const proof_index& index )const;
         void                               store_proof_record( const proof_record& record );

         oattestation_record                get_attestation_record( const proof_index& index )const;
         void                               store_attestation_record( const attestation_record& record );

         obalance_record                    get_balance_record( const balance_id_type& id )const;
         void                               store_balance_record( const balance_record& record );

         orole_record                       get_role_record( const address& holder )const;
         void                               store_role_record( const role_record& record );
         void                               remove_role_record( const address& holder );

         role_type                          get_role( const address& holder )const;
         bool                               has_role( const address& holder, role_type role )const;

         otransaction_record                get_transaction( const transaction_id_type& trx_id )const;
         void                               store_transaction( const transaction_id_type& trx_id,
                                                               const transaction_record& record );

         template<typename T, typename U>
         optional<T> lookup( const U& key )const
         { try {
             return T::lookup( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }

         template<typename T, typename U>
         void store( const U& key, const T& record )
         { try {
#ifdef PIFP_TEST_NETWORK
             record.sanity_check( *this );
#endif
             T::store( *this, key, record );
         } FC_CAPTURE_AND_RETHROW( (key)(record) ) }

         template<typename T, typename U>
         void remove( const U& key )
         { try {
             T::remove( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }
   };
   typedef std::shared_ptr<chain_interface> chain_interface_ptr;

} } // pifp::blockchain
