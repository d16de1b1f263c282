#pragma once

#include <pifp/oracle/types.hpp>

namespace pifp { namespace oracle {

/** describes one validator instance; type is "digest_match" or "signed_payload" */
struct validator_config
{
   string                  type;
   /** digest_match: hashes of the payloads that are accepted */
   vector<digest_type>     accepted_digests;
   /** signed_payload: the address that must have signed the payload body */
   optional<address>       attester;
};

struct schema_binding
{
   digest_type             schema_hash;
   validator_config        validator;
};

struct oracle_config
{
   /** processing attempts before a request is parked for manual review */
   uint32_t                   max_attempts = 3;
   /** seconds until an attestation transaction expires */
   uint32_t                   attestation_expiration_sec = 60*60;
   /** used for schemas without a binding; requests for unbound schemas are rejected without one */
   optional<validator_config> default_validator;
   vector<schema_binding>     schema_bindings;
};

} } // pifp::oracle

FC_REFLECT( pifp::oracle::validator_config, (type)(accepted_digests)(attester) )
FC_REFLECT( pifp::oracle::schema_binding, (schema_hash)(validator) )
FC_REFLECT( pifp::oracle::oracle_config, (max_attempts)(attestation_expiration_sec)(default_validator)(schema_bindings) )
