#pragma once

#include <pifp/blockchain/types.hpp>
#include <fc/time.hpp>

namespace pifp { namespace blockchain {

struct genesis_balance
{
   address      owner;
   share_type   balance = 0;
};

struct genesis_state
{
   fc::time_point_sec       timestamp;
   address                  super_admin;
   vector<address>          oracles;
   vector<genesis_balance>  initial_balances;
   uint16_t                 protocol_fee_bps = 0;
   optional<address>        fee_collector;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::genesis_balance, (owner)(balance) )
FC_REFLECT( pifp::blockchain::genesis_state, (timestamp)(super_admin)(oracles)(initial_balances)(protocol_fee_bps)(fee_collector) )
