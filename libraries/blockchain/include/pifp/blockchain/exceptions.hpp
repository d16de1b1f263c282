#pragma once

#include <fc/exception/exception.hpp>

namespace pifp { namespace blockchain {

FC_DECLARE_EXCEPTION(         blockchain_exception,                                                     30000, "Blockchain Exception" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,                pifp::blockchain::blockchain_exception, 30001, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( unsupported_chain_operation,      pifp::blockchain::blockchain_exception, 30003, "unsupported chain operation" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_genesis,                  pifp::blockchain::blockchain_exception, 30004, "invalid genesis state" );

FC_DECLARE_EXCEPTION(         evaluation_error,                                                     31000, "Evaluation Error" );
FC_DECLARE_DERIVED_EXCEPTION( expired_transaction,              pifp::blockchain::evaluation_error, 31001, "expired transaction" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_transaction_expiration,   pifp::blockchain::evaluation_error, 31002, "invalid transaction expiration" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_transaction,            pifp::blockchain::evaluation_error, 31003, "duplicate transaction" );
FC_DECLARE_DERIVED_EXCEPTION( unbalanced_transaction,           pifp::blockchain::evaluation_error, 31004, "transaction balance is not zero" );
FC_DECLARE_DERIVED_EXCEPTION( oversized_transaction,            pifp::blockchain::evaluation_error, 31005, "transaction exceeded the maximum operation count" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_balance_record,           pifp::blockchain::evaluation_error, 31006, "unknown balance record" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,               pifp::blockchain::evaluation_error, 31007, "insufficient funds" );

// Protocol error taxonomy; every failed operation aborts its whole transaction
FC_DECLARE_DERIVED_EXCEPTION( invalid_parameters,               pifp::blockchain::evaluation_error, 31101, "invalid parameters" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_state,                    pifp::blockchain::evaluation_error, 31102, "operation not allowed in the current project state" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                   pifp::blockchain::evaluation_error, 31103, "invalid amount" );
FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                     pifp::blockchain::evaluation_error, 31104, "unauthorized" );
FC_DECLARE_DERIVED_EXCEPTION( unauthorized_oracle,              pifp::blockchain::evaluation_error, 31105, "attestation signer is not an authorized oracle" );
FC_DECLARE_DERIVED_EXCEPTION( already_settled,                  pifp::blockchain::evaluation_error, 31106, "already settled" );

FC_DECLARE_DERIVED_EXCEPTION( unknown_project,                  pifp::blockchain::invalid_parameters, 31201, "unknown project" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_donation,                 pifp::blockchain::invalid_parameters, 31202, "unknown donation" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_proof,                    pifp::blockchain::invalid_parameters, 31203, "unknown proof submission" );
FC_DECLARE_DERIVED_EXCEPTION( missing_signature,                pifp::blockchain::unauthorized,       31204, "missing signature" );

} } // pifp::blockchain
