#pragma once

#include <pifp/blockchain/commitment.hpp>
#include <pifp/blockchain/proof_record.hpp>
#include <pifp/blockchain/types.hpp>

#include <fc/time.hpp>

#include <string>
#include <vector>

namespace pifp { namespace oracle {
using pifp::blockchain::address;
using pifp::blockchain::commitment_secret;
using pifp::blockchain::digest_type;
using pifp::blockchain::private_key_type;
using pifp::blockchain::project_id_type;
using pifp::blockchain::proof_index;
using pifp::blockchain::submission_id_type;
using pifp::blockchain::verdict_type;
using fc::time_point_sec;
using fc::ecc::compact_signature;
using fc::variant;
using fc::optional;
using std::string;
using std::vector;

enum request_status_enum {
   awaiting_processing,
   in_processing,
   attested,
   needs_manual_review
};

/**
 *  What an implementer hands to the oracle out of band after committing to
 *  a proof on-chain.  The secret opens the on-chain proof commitment over
 *  proof_payload; schema_document is the document whose hash the project
 *  registered as its proof schema.
 */
struct proof_request
{
   proof_index proof()const { return proof_index( project_id, submission ); }

   project_id_type      project_id = 0;
   submission_id_type   submission = 0;
   vector<char>         proof_payload;
   commitment_secret    secret;
   string               schema_document;
};

struct proof_request_summary
{
   fc::microseconds                     id;
   request_status_enum                  status = awaiting_processing;
   project_id_type                      project_id = 0;
   submission_id_type                   submission = 0;
};

/** a request as it is kept in the oracle queue */
struct proof_request_record : public proof_request_summary
{
   proof_request_record(){}
   proof_request_record( const proof_request& r, fc::microseconds request_id )
      : request(r)
   {
      id = request_id;
      project_id = r.project_id;
      submission = r.submission;
   }

   proof_request                                    request;
   uint32_t                                         attempts = 0;
   optional<fc::enum_type<uint8_t,verdict_type>>    verdict;
   optional<string>                                 rejection_reason;
   optional<string>                                 last_error;
   optional<pifp::blockchain::transaction_id_type>  attestation_transaction;
};

/**
 *  A payload for signed_payload_validator: the body plus a compact signature
 *  over sha256( body ) by the attester the schema names.
 */
struct signed_payload
{
   digest_type digest()const;

   vector<char>         body;
   compact_signature    signature;
};

} } // pifp::oracle

FC_REFLECT_ENUM( pifp::oracle::request_status_enum, (awaiting_processing)(in_processing)(attested)(needs_manual_review) )
FC_REFLECT( pifp::oracle::proof_request, (project_id)(submission)(proof_payload)(secret)(schema_document) )
FC_REFLECT( pifp::oracle::proof_request_summary, (id)(status)(project_id)(submission) )
FC_REFLECT_DERIVED( pifp::oracle::proof_request_record, (pifp::oracle::proof_request_summary),
                    (request)(attempts)(verdict)(rejection_reason)(last_error)(attestation_transaction) )
FC_REFLECT( pifp::oracle::signed_payload, (body)(signature) )
