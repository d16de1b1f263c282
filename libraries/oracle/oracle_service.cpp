#include <pifp/oracle/exceptions.hpp>
#include <pifp/oracle/oracle_service.hpp>

#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/oracle_operations.hpp>
#include <pifp/blockchain/time.hpp>
#include <pifp/db/level_map.hpp>

#include <fc/io/json.hpp>
#include <fc/io/raw_variant.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

#define SANITY_CHECK\
    if( !is_open() ) FC_THROW_EXCEPTION( oracle_not_open, "Oracle service is not open. Is the oracle enabled in the config?" )

namespace pifp { namespace oracle {
namespace detail {
using namespace boost::multi_index;
using namespace pifp::blockchain;

class oracle_service_impl {
protected:
   //Dummy types to tag multi_index_container indices
   struct by_id;
   struct by_status;
public:
   oracle_service_impl(const private_key_type& key, const chain_interface_ptr& chain, const attestation_sink_ptr& sink)
      : _oracle_key(key), _chain(chain), _sink(sink)
   {
      FC_ASSERT( _chain, "oracle service requires a ledger" );
      FC_ASSERT( _sink, "oracle service requires an attestation sink" );
   }

   boost::multi_index_container<
      proof_request_summary,
      indexed_by<
         ordered_unique<
            tag<by_id>,
            member<proof_request_summary, fc::microseconds, &proof_request_summary::id>
         >,
         ordered_unique<
            tag<by_status>,
            composite_key<
               proof_request_summary,
               member<proof_request_summary, request_status_enum, &proof_request_summary::status>,
               member<proof_request_summary, fc::microseconds, &proof_request_summary::id>
            >
         >
      >
   > _request_summary_db;
   pifp::db::level_map<fc::microseconds, proof_request_record> _request_db;

   private_key_type        _oracle_key;
   chain_interface_ptr     _chain;
   attestation_sink_ptr    _sink;
   oracle_config           _config;
   validator_registry      _validators;
   fc::microseconds        _last_request_id;

   void open(const fc::path& data_dir, const oracle_config& config)
   {
      FC_ASSERT( !is_open(), "Refusing to open already-open oracle service." );
      if( config.max_attempts == 0 )
         FC_THROW_EXCEPTION( invalid_oracle_config, "max_attempts must be at least 1" );

      _config = config;
      _validators.configure( config );

      _request_db.open(data_dir / "proof_request_db");
      for( auto itr = _request_db.begin(); itr.valid(); ++itr )
      {
         auto rec = itr.value();
         //This is a startup routine; if there are in_processing records on disk, we probably crashed.
         //Whether the attestation reached the ledger is checked again when the request is processed.
         if( rec.status == in_processing )
         {
            fc_wlog( fc::logger::get("oracle"), "returning interrupted proof request ${id} to the queue", ("id",rec.id) );
            rec.status = awaiting_processing;
            commit_record(rec);
         }
         else
            _request_summary_db.insert(rec);

         if( _last_request_id < rec.id )
            _last_request_id = rec.id;
      }
   }
   void close()
   {
      if( is_open() )
      {
         _request_db.close();
         _request_summary_db.clear();
      }
   }
   bool is_open() const
   {
      return _request_db.is_open();
   }

   fc::microseconds next_request_id()
   {
      fc::microseconds id = fc::time_point::now().time_since_epoch();
      if( !(_last_request_id < id) )
         id = _last_request_id + fc::microseconds(1);
      _last_request_id = id;
      return id;
   }

   proof_request_record fetch_request_by_id(fc::microseconds id) const
   {
      const auto record = _request_db.fetch_optional(id);
      if( !record.valid() )
         FC_THROW_EXCEPTION( unknown_request, "no proof request ${id}", ("id",id) );
      return *record;
   }

   vector<proof_request_summary> list_requests_by_status(request_status_enum status,
                                                         fc::microseconds after_time,
                                                         uint32_t limit) const
   {
      vector<proof_request_summary> results;
      auto& index = _request_summary_db.get<by_status>();
      auto end = index.end();
      auto itr = index.lower_bound(boost::make_tuple(status, after_time));

      if( limit == 0 || itr == end || itr->status != status )
         return results;
      if( itr->id == after_time ) ++itr;

      while( itr != end && results.size() < limit && itr->status == status )
         results.push_back(*itr++);

      return results;
   }

   void commit_record(const proof_request_record& record)
   {
      auto& index = _request_summary_db.get<by_id>();
      auto itr = index.find(record.id);
      if( itr == index.end() )
         _request_summary_db.insert(record);
      else
         index.replace(itr, record);

      _request_db.store(record.id, record);
   }

   proof_request_record update_record_status(fc::microseconds id, request_status_enum status)
   {
      auto request = fetch_request_by_id(id);
      request.status = status;
      commit_record(request);
      return request;
   }

   optional<proof_request_record> take_next_request()
   {
      auto request_summary_vector = list_requests_by_status(awaiting_processing, fc::microseconds(), 1);
      if( request_summary_vector.empty() )
         return optional<proof_request_record>();

      return update_record_status(request_summary_vector[0].id, in_processing);
   }

   verdict_type evaluate(const proof_request& request,
                         const project_record& project,
                         const proof_record& proof,
                         string& reason) const
   {
      if( fc::sha256::hash(request.schema_document) != project.proof_schema_hash )
      {
         reason = "schema document does not match the project's proof schema";
         return rejected_verdict;
      }

      if( !verify_proof(proof.proof_commitment, request.secret, request.proof_payload) )
      {
         reason = "revealed proof does not open the on-chain commitment";
         return rejected_verdict;
      }

      const proof_validator_ptr validator = _validators.find_validator(project.proof_schema_hash);
      if( !validator )
      {
         reason = "no validator for proof schema " + project.proof_schema_hash.str();
         return rejected_verdict;
      }

      validation_result result = validation_result::reject( string() );
      try
      {
         result = validator->validate(request);
      }
      catch( const oracle_transient_failure& )
      {
         throw;
      }
      catch( const fc::exception& e )
      {
         result = validation_result::reject( "validator failed: " + e.to_string() );
      }
      catch( const std::exception& e )
      {
         result = validation_result::reject( string("validator failed: ") + e.what() );
      }

      if( !result.accepted )
      {
         reason = validator->name() + ": " + result.reason;
         return rejected_verdict;
      }

      reason.clear();
      return verified_verdict;
   }

   void park(proof_request_record& record, const string& error)
   {
      fc_elog( fc::logger::get("oracle"), "proof request ${id} needs manual review: ${e}", ("id",record.id)("e",error) );
      record.status = needs_manual_review;
      record.last_error = error;
      commit_record(record);
   }

   void record_transient_failure(proof_request_record& record, const fc::exception& e)
   {
      if( record.attempts >= _config.max_attempts )
      {
         park(record, e.to_string());
         return;
      }

      fc_wlog( fc::logger::get("oracle"), "attempt ${n} of proof request ${id} failed, will retry: ${e}",
            ("n",record.attempts)("id",record.id)("e",e.to_detail_string()) );
      record.status = awaiting_processing;
      record.last_error = e.to_string();
      commit_record(record);
   }

   signed_transaction make_attestation(const proof_record& proof, verdict_type verdict) const
   {
      const time_point_sec now = pifp::blockchain::now();
      const digest_type chain_id = _chain->get_chain_id();

      signed_transaction trx;
      trx.expiration = now + _config.attestation_expiration_sec;
      trx.operations.emplace_back( attest_proof_operation::sign( _oracle_key, chain_id, proof.index,
                                                                 proof.proof_commitment, verdict, now ) );
      trx.sign( _oracle_key, chain_id );
      return trx;
   }

   void process(proof_request_record record)
   {
      ++record.attempts;
      const proof_index index = record.request.proof();

      const oattestation_record existing = _chain->get_attestation_record(index);
      if( existing.valid() )
      {
         fc_ilog( fc::logger::get("oracle"), "proof ${proof} is already attested, skipping request ${id}", ("proof",index)("id",record.id) );
         record.status = attested;
         record.verdict = existing->verdict;
         commit_record(record);
         return;
      }

      const oproof_record proof = _chain->get_proof_record(index);
      const oproject_record project = _chain->get_project_record(index.project_id);
      if( !proof.valid() || !project.valid() )
      {
         park(record, "no proof submission " + fc::json::to_string(index) + " on the ledger");
         return;
      }

      string reason;
      verdict_type verdict = pending_verdict;
      try
      {
         verdict = evaluate(record.request, *project, *proof, reason);
      }
      catch( const oracle_transient_failure& e )
      {
         record_transient_failure(record, e);
         return;
      }

      signed_transaction trx;
      try
      {
         trx = make_attestation(*proof, verdict);
         _sink->submit(trx);
      }
      catch( const already_settled& e )
      {
         fc_ilog( fc::logger::get("oracle"), "attestation for ${proof} was already recorded: ${e}", ("proof",index)("e",e.to_string()) );
      }
      catch( const oracle_transient_failure& e )
      {
         record_transient_failure(record, e);
         return;
      }
      catch( const fc::exception& e )
      {
         park(record, e.to_detail_string());
         return;
      }
      catch( const std::exception& e )
      {
         park(record, e.what());
         return;
      }

      fc_ilog( fc::logger::get("oracle"), "attested proof ${proof} as ${verdict}", ("proof",index)("verdict",verdict) );
      record.status = attested;
      record.verdict = fc::enum_type<uint8_t,verdict_type>( verdict );
      if( verdict == rejected_verdict )
         record.rejection_reason = reason;
      record.attestation_transaction = trx.id();
      commit_record(record);
   }
};
} // namespace detail

oracle_service::oracle_service(const private_key_type& oracle_key,
                               const pifp::blockchain::chain_interface_ptr& chain,
                               const attestation_sink_ptr& sink)
    : my(new detail::oracle_service_impl(oracle_key, chain, sink))
{}

oracle_service::~oracle_service()
{
   my->close();
}

void oracle_service::open(const fc::path& data_dir, const oracle_config& config)
{
   my->open(data_dir, config);
}

void oracle_service::close()
{
   my->close();
}

bool oracle_service::is_open() const
{
   return my->is_open();
}

address oracle_service::oracle_address() const
{
   return address(my->_oracle_key.get_public_key());
}

validator_registry& oracle_service::validators()
{
   return my->_validators;
}

fc::microseconds oracle_service::store_request(const proof_request& request)
{
   SANITY_CHECK;
   FC_ASSERT( request.project_id > 0 && request.submission > 0, "request does not name a proof submission",
              ("project_id",request.project_id)("submission",request.submission) );
   const proof_request_record record(request, my->next_request_id());
   my->commit_record(record);
   fc_ilog( fc::logger::get("oracle"), "queued proof request ${id} for ${proof}", ("id",record.id)("proof",request.proof()) );
   return record.id;
}

vector<proof_request_summary> oracle_service::list_requests(request_status_enum status,
                                                            fc::microseconds after_time,
                                                            uint32_t limit) const
{
   SANITY_CHECK;
   return my->list_requests_by_status(status, after_time, limit);
}

proof_request_record oracle_service::peek_request(fc::microseconds request_id) const
{
   SANITY_CHECK;
   return my->fetch_request_by_id(request_id);
}

fc::optional<proof_request_record> oracle_service::take_next_request()
{
   SANITY_CHECK;
   return my->take_next_request();
}

verdict_type oracle_service::evaluate_request(const proof_request& request, string& reason) const
{
   const proof_index index = request.proof();
   const auto proof = my->_chain->get_proof_record(index);
   const auto project = my->_chain->get_project_record(index.project_id);
   if( !proof.valid() || !project.valid() )
   {
      reason = "no proof submission on the ledger";
      return pifp::blockchain::rejected_verdict;
   }
   return my->evaluate(request, *project, *proof, reason);
}

bool oracle_service::process_next_request()
{
   SANITY_CHECK;
   const auto request = my->take_next_request();
   if( !request.valid() )
      return false;
   my->process(*request);
   return true;
}

uint32_t oracle_service::process_pending()
{
   SANITY_CHECK;
   uint32_t processed = 0;
   // a request returned to the queue for retry is picked up again in the same pass
   while( process_next_request() )
      ++processed;
   return processed;
}

void oracle_service::retry_request(fc::microseconds request_id)
{
   SANITY_CHECK;
   auto record = my->fetch_request_by_id(request_id);
   FC_ASSERT( record.status == needs_manual_review, "only parked requests can be retried", ("status",record.status) );
   record.status = awaiting_processing;
   record.attempts = 0;
   my->commit_record(record);
}

} } // namespace pifp::oracle
