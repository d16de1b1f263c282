#pragma once
#include <pifp/blockchain/chain_interface.hpp>
#include <fc/reflect/reflect.hpp>

namespace pifp { namespace blockchain {

   /**
    *  Buffers every record written while a transaction is evaluated.  Reads fall
    *  through to the previous state; nothing reaches it until apply_changes(), so
    *  discarding a pending state discards all effects of a failed transaction.
    */
   class pending_chain_state : public chain_interface, public std::enable_shared_from_this<pending_chain_state>
   {
      public:
                                        pending_chain_state( chain_interface_ptr prev_state = chain_interface_ptr() );

         virtual fc::time_point_sec     now()const override;

         virtual bool                   is_known_transaction( const transaction& trx )const override;

         void                           apply_changes()const;

         template<typename T, typename U>
         void apply_records( const chain_interface_ptr& prev_state, const T& store_map, const U& remove_set )const
         {
             using V = typename T::mapped_type;
             for( const auto& key : remove_set ) prev_state->remove<V>( key );
             for( const auto& item : store_map ) prev_state->store( item.first, item.second );
         }

         map<property_id_type, property_record>                             _property_id_to_record;
         set<property_id_type>                                              _property_id_remove;

         map<project_id_type, project_record>                               _project_id_to_record;
         set<project_id_type>                                               _project_id_remove;

         map<donation_index, donation_record>                               _donation_index_to_record;
         set<donation_index>                                                _donation_index_remove;

         map<proof_index, proof_record>                                     _proof_index_to_record;
         set<proof_index>                                                   _proof_index_remove;

         map<proof_index, attestation_record>                               _attestation_proof_to_record;
         set<proof_index>                                                   _attestation_proof_remove;

         map<balance_id_type, balance_record>                               _balance_id_to_record;
         set<balance_id_type>                                               _balance_id_remove;

         map<address, role_record>                                          _role_holder_to_record;
         set<address>                                                       _role_holder_remove;

         map<transaction_id_type, transaction_record>                       _transaction_id_to_record;
         set<transaction_id_type>                                           _transaction_id_remove;
         unordered_set<digest_type>                                         _transaction_digests;

      private:
         // Not serialized
         std::weak_ptr<chain_interface>                                     _prev_state;

         template<typename V, typename T, typename U, typename K>
         optional<V> lookup_record( const T& store_map, const U& remove_set, const K& key )const
         {
             const auto iter = store_map.find( key );
             if( iter != store_map.end() ) return iter->second;
             if( remove_set.count( key ) > 0 ) return optional<V>();
             const chain_interface_ptr prev_state = _prev_state.lock();
             if( !prev_state ) return optional<V>();
             return prev_state->lookup<V>( key );
         }

         template<typename T, typename U, typename K, typename V>
         static void insert_record( T& store_map, U& remove_set, const K& key, const V& record )
         {
             remove_set.erase( key );
             store_map[ key ] = record;
         }

         template<typename T, typename U, typename K>
         static void erase_record( T& store_map, U& remove_set, const K& key )
         {
             store_map.erase( key );
             remove_set.insert( key );
         }

         virtual oproperty_record property_lookup_by_id( const property_id_type )const override;
         virtual void property_insert_into_id_map( const property_id_type, const property_record& )override;
         virtual void property_erase_from_id_map( const property_id_type )override;

         virtual oproject_record project_lookup_by_id( const project_id_type )const override;
         virtual void project_insert_into_id_map( const project_id_type, const project_record& )override;
         virtual void project_erase_from_id_map( const project_id_type )override;

         virtual odonation_record donation_lookup_by_index( const donation_index& )const override;
         virtual void donation_insert_into_index_map( const donation_index&, const donation_record& )override;
         virtual void donation_erase_from_index_map( const donation_index& )override;

         virtual oproof_record proof_lookup_by_index( const proof_index& )const override;
         virtual void proof_insert_into_index_map( const proof_index&, const proof_record& )override;
         virtual void proof_erase_from_index_map( const proof_index& )override;

         virtual oattestation_record attestation_lookup_by_proof( const proof_index& )const override;
         virtual void attestation_insert_into_proof_map( const proof_index&, const attestation_record& )override;
         virtual void attestation_erase_from_proof_map( const proof_index& )override;

         virtual obalance_record balance_lookup_by_id( const balance_id_type& )const override;
         virtual void balance_insert_into_id_map( const balance_id_type&, const balance_record& )override;
         virtual void balance_erase_from_id_map( const balance_id_type& )override;

         virtual orole_record role_lookup_by_holder( const address& )const override;
         virtual void role_insert_into_holder_map( const address&, const role_record& )override;
         virtual void role_erase_from_holder_map( const address& )override;

         virtual otransaction_record transaction_lookup_by_id( const transaction_id_type& )const override;
         virtual void transaction_insert_into_id_map( const transaction_id_type&, const transaction_record& )override;
         virtual void transaction_erase_from_id_map( const transaction_id_type& )override;
   };
   typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::pending_chain_state,
            (_property_id_to_record)
            (_property_id_remove)
            (_project_id_to_record)
            (_project_id_remove)
            (_donation_index_to_record)
            (_donation_index_remove)
            (_proof_index_to_record)
            (_proof_index_remove)
            (_attestation_proof_to_record)
            (_attestation_proof_remove)
            (_balance_id_to_record)
            (_balance_id_remove)
            (_role_holder_to_record)
            (_role_holder_remove)
            (_transaction_id_to_record)
            (_transaction_id_remove)
            (_transaction_digests)
            )
