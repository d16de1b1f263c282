#pragma once

#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

struct balance_record;
typedef fc::optional<balance_record> obalance_record;

class chain_interface;

/**
 *  Spendable funds of one address in the ledger's single backing asset.
 *  Value locked in a project is not part of any balance record until it is
 *  released to the implementer or refunded to a donor.
 */
struct balance_record
{
    balance_record(){}
    explicit balance_record( const address& owner_arg )
        :owner(owner_arg){}

    balance_id_type id()const { return owner; }

    address             owner;
    share_type          balance = 0;
    time_point_sec      last_update;

    void sanity_check( const chain_interface& )const;
    static obalance_record lookup( const chain_interface&, const balance_id_type& );
    static void store( chain_interface&, const balance_id_type&, const balance_record& );
    static void remove( chain_interface&, const balance_id_type& );
};

class balance_db_interface
{
    friend struct balance_record;

    virtual obalance_record balance_lookup_by_id( const balance_id_type& )const = 0;
    virtual void balance_insert_into_id_map( const balance_id_type&, const balance_record& ) = 0;
    virtual void balance_erase_from_id_map( const balance_id_type& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::balance_record, (owner)(balance)(last_update) )
