#pragma once

#include <pifp/blockchain/address.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fc
{
    class path;
}

namespace pifp { namespace blockchain {

    typedef fc::ripemd160               transaction_id_type;
    typedef fc::sha256                  digest_type;
    typedef fc::sha256                  commitment_type;
    typedef fc::ecc::compact_signature  signature_type;
    typedef fc::ecc::private_key        private_key_type;
    typedef fc::ecc::public_key         public_key_type;
    typedef address                     balance_id_type;
    typedef uint64_t                    project_id_type;
    typedef uint32_t                    donation_id_type;
    typedef uint32_t                    submission_id_type;
    typedef int64_t                     share_type;

    using std::string;
    using std::function;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;
    using std::map;
    using std::unordered_map;
    using std::set;
    using std::unordered_set;
    using std::vector;
    using std::pair;
    using fc::path;
    using fc::sha512;
    using fc::sha256;
    using std::unique_ptr;
    using std::shared_ptr;
    using fc::time_point_sec;
    using fc::time_point;
    using fc::microseconds;

} } // pifp::blockchain
