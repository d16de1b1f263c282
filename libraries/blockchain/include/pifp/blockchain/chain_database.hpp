#pragma once

#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/blockchain/genesis_state.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>

namespace pifp { namespace blockchain {

   namespace detail { class chain_database_impl; }

   struct transaction_evaluation_state;
   typedef std::shared_ptr<transaction_evaluation_state> transaction_evaluation_state_ptr;

   class chain_observer
   {
      public:
         virtual ~chain_observer() {}
         /** called once per committed transaction, after its events have been journaled */
         virtual void transaction_applied( const transaction_record& record ) = 0;
         virtual void event_emitted( const event_record& ) {}
   };

   /**
    *  The persistent ledger.  Every transaction is evaluated against its own
    *  pending_chain_state and merged into the database only when every one of
    *  its operations succeeded.
    *
    *  Must be owned by a shared_ptr; pending states refer back to it.
    */
   class chain_database : public chain_interface, public std::enable_shared_from_this<chain_database>
   {
      public:
         chain_database();
         virtual ~chain_database()override;

         /** initializes a new ledger from genesis; an existing ledger ignores the genesis */
         void open( const fc::path& data_dir, const genesis_state& genesis );
         void open( const fc::path& data_dir, const fc::optional<fc::path>& genesis_file );
         void close();

         bool is_open()const;

         void add_observer( chain_observer* observer );
         void remove_observer( chain_observer* observer );

         /** evaluates and commits trx, throws without any effect if it is invalid */
         transaction_evaluation_state_ptr   push_transaction( const signed_transaction& trx );

         /** evaluates trx against a throw-away state */
         transaction_evaluation_state_ptr   evaluate_transaction( const signed_transaction& trx );

         virtual fc::time_point_sec         now()const override;
         virtual bool                       is_known_transaction( const transaction& trx )const override;

         oproject_record                    get_project( project_id_type id )const;
         vector<project_record>             get_projects( project_id_type first = 1, uint32_t limit = uint32_t(-1) )const;
         vector<donation_record>            get_donations( project_id_type id )const;
         vector<proof_record>               get_proofs( project_id_type id )const;
         oattestation_record                get_attestation( const proof_index& proof )const;
         share_type                         get_balance( const address& owner )const;

         /** journaled events with a sequence number greater than after_sequence */
         vector<event_record>               get_events( uint64_t after_sequence = 0, uint32_t limit = uint32_t(-1) )const;
         uint64_t                           last_event_sequence()const;

      private:
         unique_ptr<detail::chain_database_impl> my;

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
   typedef shared_ptr<chain_database> chain_database_ptr;

} } // pifp::blockchain
