#pragma once

#include <pifp/blockchain/chain_database.hpp>
#include <pifp/db/level_map.hpp>

#include <fc/thread/mutex.hpp>

namespace pifp { namespace blockchain {

   namespace detail
   {
      class chain_database_impl
      {
         public:
            void                                        open_database( const fc::path& data_dir );
            void                                        initialize_genesis( const genesis_state& genesis );
            void                                        journal_events( transaction_record& record );
            void                                        notify_observers( const transaction_record& record )const;

            chain_database*                                                 self = nullptr;
            unordered_set<chain_observer*>                                  _observers;

            fc::mutex                                                       _push_transaction_mutex;

            pifp::db::level_map<uint8_t, property_record>                   _property_id_to_record;

            pifp::db::level_map<project_id_type, project_record>            _project_id_to_record;
            pifp::db::level_map<donation_index, donation_record>            _donation_index_to_record;
            pifp::db::level_map<proof_index, proof_record>                  _proof_index_to_record;
            pifp::db::level_map<proof_index, attestation_record>            _attestation_proof_to_record;

            pifp::db::level_map<balance_id_type, balance_record>            _balance_id_to_record;
            pifp::db::level_map<address, role_record>                       _role_holder_to_record;

            pifp::db::level_map<transaction_id_type, transaction_record>    _transaction_id_to_record;
            pifp::db::level_map<digest_type, transaction_id_type>           _transaction_digest_to_id;

            pifp::db::level_map<uint64_t, event_record>                     _event_sequence_to_record;
            uint64_t                                                        _last_event_sequence = 0;
      };

  } // detail
} } // pifp::blockchain
