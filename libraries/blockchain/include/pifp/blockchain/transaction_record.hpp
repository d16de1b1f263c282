#pragma once

#include <pifp/blockchain/event_record.hpp>
#include <pifp/blockchain/transaction.hpp>

namespace pifp { namespace blockchain {

struct transaction_record;
typedef fc::optional<transaction_record> otransaction_record;

class chain_interface;

/** an applied transaction together with the events its operations emitted */
struct transaction_record
{
    transaction_record(){}
    transaction_record( const signed_transaction& t, const event_records& e, const time_point_sec applied )
        :trx(t),events(e),applied_at(applied){}

    signed_transaction      trx;
    event_records           events;
    time_point_sec          applied_at;

    void sanity_check( const chain_interface& )const;
    static otransaction_record lookup( const chain_interface&, const transaction_id_type& );
    static void store( chain_interface&, const transaction_id_type&, const transaction_record& );
    static void remove( chain_interface&, const transaction_id_type& );
};

class transaction_db_interface
{
    friend struct transaction_record;

    virtual otransaction_record transaction_lookup_by_id( const transaction_id_type& )const = 0;
    virtual void transaction_insert_into_id_map( const transaction_id_type&, const transaction_record& ) = 0;
    virtual void transaction_erase_from_id_map( const transaction_id_type& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::transaction_record, (trx)(events)(applied_at) )
