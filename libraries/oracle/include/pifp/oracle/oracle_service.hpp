#pragma once

#include <pifp/blockchain/chain_interface.hpp>
#include <pifp/oracle/attestation_sink.hpp>
#include <pifp/oracle/config.hpp>
#include <pifp/oracle/proof_validator.hpp>
#include <pifp/oracle/types.hpp>

#include <fc/filesystem.hpp>

namespace pifp { namespace oracle {
namespace detail { class oracle_service_impl; }

/**
 * @brief The oracle_service class verifies proof submissions off-chain and attests the verdicts on-chain.
 *
 * Implementers deliver the raw proof of a submission to the service as a proof_request. Requests are persisted as
 * awaiting processing and assigned a unique timestamp in microseconds, which is used as the request ID. Processing a
 * request checks the schema document against the project's proof schema hash, opens the on-chain proof commitment
 * with the revealed secret and runs the validator bound to the schema. The resulting verdict is signed with the
 * oracle key and handed to the attestation sink. A proof that fails any check is attested as rejected; it never
 * stalls the queue.
 *
 * Failures that may succeed later (oracle_transient_failure) leave the request awaiting processing until it has been
 * attempted max_attempts times, after which it is parked as needs_manual_review and the proof stays pending
 * on-chain. Requests found in_processing on open are returned to the queue, and a proof that already has an
 * attestation on-chain is never attested twice, so the service can be restarted at any point.
 */
class oracle_service {
   std::shared_ptr<detail::oracle_service_impl> my;

public:
   /**
    * @param oracle_key Key whose address holds the oracle role on the ledger
    * @param chain Read-only view of the ledger used to look up projects, proofs and attestations
    * @param sink Receives the signed attestation transactions
    */
   oracle_service(const private_key_type& oracle_key,
                  const pifp::blockchain::chain_interface_ptr& chain,
                  const attestation_sink_ptr& sink);
   ~oracle_service();

   void open(const fc::path& data_dir, const oracle_config& config = oracle_config());
   void close();
   bool is_open() const;

   address oracle_address() const;

   /** validators configured from the oracle_config passed to open; may be extended afterwards */
   validator_registry& validators();

   /**
    * @brief Queue a proof for verification.
    * @return The ID of the new request
    */
   fc::microseconds store_request(const proof_request& request);

   /**
    * @brief Retrieve requests of a certain status, oldest first.
    * @param status Only requests with this status will be returned
    * @param after_time Only requests received after this time will be returned
    * @param limit The maximum number of records to return
    */
   vector<proof_request_summary> list_requests(request_status_enum status = awaiting_processing,
                                               fc::microseconds after_time = fc::microseconds(),
                                               uint32_t limit = 10) const;

   /**
    * @brief Retrieve a request without changing its status.
    * @throws unknown_request If request_id does not match any known request
    */
   proof_request_record peek_request(fc::microseconds request_id) const;

   /**
    * @brief Retrieve the next request in line and mark it as in-processing.
    * @return The next awaiting request, or null if the queue is empty
    */
   fc::optional<proof_request_record> take_next_request();

   /**
    * @brief Decide the verdict for a proof request.
    *
    * Does not touch the queue or the ledger.
    * @throws oracle_transient_failure If the validator could not reach a decision
    */
   verdict_type evaluate_request(const proof_request& request, string& reason) const;

   /**
    * @brief Process the next awaiting request end to end.
    * @return false if there was nothing to process
    */
   bool process_next_request();

   /** @brief Process awaiting requests until the queue is empty; returns the number of requests processed. */
   uint32_t process_pending();

   /**
    * @brief Return a parked request to the queue with a fresh attempt budget.
    * @throws unknown_request If request_id does not match any known request
    */
   void retry_request(fc::microseconds request_id);
};

typedef std::shared_ptr<oracle_service> oracle_service_ptr;
} } // namespace pifp::oracle
