#pragma once

#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

enum class property_id_type : uint8_t
{
    database_version            = 0,
    chain_id                    = 1,
    last_project_id             = 2,
    authority_version           = 3,
    protocol_fee_bps            = 4,
    fee_collector               = 5,
    super_admin                 = 6
};

struct property_record;
typedef fc::optional<property_record> oproperty_record;

class chain_interface;
struct property_record
{
    property_id_type    id;
    variant             value;

    void sanity_check( const chain_interface& )const;
    static oproperty_record lookup( const chain_interface&, const property_id_type );
    static void store( chain_interface&, const property_id_type, const property_record& );
    static void remove( chain_interface&, const property_id_type );
};

class property_db_interface
{
    friend struct property_record;

    virtual oproperty_record property_lookup_by_id( const property_id_type )const = 0;
    virtual void property_insert_into_id_map( const property_id_type, const property_record& ) = 0;
    virtual void property_erase_from_id_map( const property_id_type ) = 0;
};

} } // pifp::blockchain

FC_REFLECT_TYPENAME( pifp::blockchain::property_id_type )
FC_REFLECT_ENUM( pifp::blockchain::property_id_type,
        (database_version)
        (chain_id)
        (last_project_id)
        (authority_version)
        (protocol_fee_bps)
        (fee_collector)
        (super_admin)
        );
FC_REFLECT( pifp::blockchain::property_record,
        (id)
        (value)
        );
