#pragma once

#include <pifp/blockchain/chain_database.hpp>
#include <pifp/blockchain/transaction.hpp>

#include <memory>

namespace pifp { namespace oracle {

/**
 *  Where signed attestation transactions go.  Submission failures the oracle
 *  should retry are reported as oracle_transient_failure; ledger rejections
 *  propagate as the ledger's own exceptions.
 */
class attestation_sink
{
   public:
      virtual ~attestation_sink(){}
      virtual void submit( const pifp::blockchain::signed_transaction& trx ) = 0;
};
typedef std::shared_ptr<attestation_sink> attestation_sink_ptr;

/** pushes attestations straight into an in-process ledger */
class chain_attestation_sink : public attestation_sink
{
   public:
      explicit chain_attestation_sink( const pifp::blockchain::chain_database_ptr& chain )
         : _chain( chain ) {}

      virtual void submit( const pifp::blockchain::signed_transaction& trx ) override
      {
         _chain->push_transaction( trx );
      }

   private:
      pifp::blockchain::chain_database_ptr _chain;
};

} } // pifp::oracle
