#pragma once

#include <stdint.h>

/* Comment out this line for a production ledger; enables record sanity checks on every store */
#define PIFP_TEST_NETWORK

/** @file pifp/blockchain/config.hpp
 *  @brief Defines global constants that determine ledger behavior
 */
#define PIFP_BLOCKCHAIN_DATABASE_VERSION                    1

/**
 *  The address prepended to string representation of
 *  addresses.
 */
#define PIFP_ADDRESS_PREFIX                                 "PIFP"
#define PIFP_BLOCKCHAIN_NAME                                "PIFP"
#define PIFP_BLOCKCHAIN_DESCRIPTION                         "Proof-of-Impact Funding Ledger"

#define PIFP_BLOCKCHAIN_MAX_TRANSACTION_EXPIRATION_SEC      (60*60*24*2)
#define PIFP_BLOCKCHAIN_MAX_OPERATIONS_PER_TRANSACTION      64

/** protocol fee is expressed in basis points of the funded amount */
#define PIFP_BLOCKCHAIN_BASIS_POINTS                        10000
#define PIFP_BLOCKCHAIN_MAX_PROTOCOL_FEE_BPS                1000

#define PIFP_BLOCKCHAIN_MAX_SHARES                          (1000*1000*int64_t(1000)*1000*int64_t(1000))

/** upper bound on how far in the future a project deadline may be set */
#define PIFP_BLOCKCHAIN_MAX_PROJECT_DURATION_SEC            (60*60*24*365*5)

#define PIFP_DEFAULT_GENESIS_FILE                           "genesis.json"
#define PIFP_DEFAULT_CONFIG_FILE                            "config.json"
