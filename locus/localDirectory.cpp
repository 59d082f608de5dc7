/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include "localDirectory.h"

#include "exception.h"
#include "log.h"
#include "nodeAddress.h"

#include <lunchbox/debug.h>
#include <lunchbox/lockable.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/spinLock.h>
#include <lunchbox/stdExt.h>

#include <servus/uint128_t.h>

#include <map>

namespace locus
{
namespace detail
{
typedef stde::hash_map< OID, NodeAddress > LocationHash;
typedef LocationHash::const_iterator LocationHashCIter;
typedef std::map< NodeAddress, std::string > NodeMap;
typedef NodeMap::const_iterator NodeMapCIter;

class LocalDirectory
{
public:
    lunchbox::Lockable< LocationHash, lunchbox::SpinLock > locations;
    lunchbox::Lockable< NodeMap, lunchbox::SpinLock > nodes;
};
}

LocalDirectory::LocalDirectory()
    : _impl( new detail::LocalDirectory )
{}

LocalDirectory::~LocalDirectory()
{
    delete _impl;
}

OID LocalDirectory::allocate( const NodeAddress& node )
{
    lunchbox::ScopedFastWrite mutex( _impl->locations );
    OID oid = servus::make_UUID();
    while( _impl->locations->find( oid ) != _impl->locations->end( ))
        oid = servus::make_UUID();

    (*_impl->locations)[ oid ] = node;
    LBLOG( LOG_OBJECTS ) << "Allocated " << oid << " on " << node << std::endl;
    return oid;
}

NodeAddress LocalDirectory::resolve( const OID& oid )
{
    lunchbox::ScopedFastRead mutex( _impl->locations );
    detail::LocationHashCIter i = _impl->locations->find( oid );
    if( i == _impl->locations->end( ))
        throw Exception( Exception::UNKNOWN_OID, oid.getString( ));
    return i->second;
}

void LocalDirectory::updateLocation( const OID& oid, const NodeAddress& node )
{
    lunchbox::ScopedFastWrite mutex( _impl->locations );
    detail::LocationHash::iterator i = _impl->locations->find( oid );
    if( i == _impl->locations->end( ))
        throw Exception( Exception::UNKNOWN_OID, oid.getString( ));

    LBLOG( LOG_MIGRATION ) << "Location of " << oid << ": " << i->second
                           << " -> " << node << std::endl;
    i->second = node;
}

void LocalDirectory::registerNode( const NodeAddress& node,
                                   const std::string& region )
{
    lunchbox::ScopedFastWrite mutex( _impl->nodes );
    (*_impl->nodes)[ node ] = region;
    LBINFO << "Registered node " << node
           << ( region.empty() ? "" : " in region " ) << region << std::endl;
}

NodeAddresses LocalDirectory::getNodes( const std::string& region )
{
    NodeAddresses nodes;
    lunchbox::ScopedFastRead mutex( _impl->nodes );
    for( detail::NodeMapCIter i = _impl->nodes->begin();
         i != _impl->nodes->end(); ++i )
    {
        if( region.empty() || i->second == region )
            nodes.push_back( i->first );
    }
    return nodes;
}

size_t LocalDirectory::getNumObjects() const
{
    lunchbox::ScopedFastRead mutex( _impl->locations );
    return _impl->locations->size();
}

OIDs LocalDirectory::getObjects( const NodeAddress& node ) const
{
    OIDs oids;
    lunchbox::ScopedFastRead mutex( _impl->locations );
    for( detail::LocationHashCIter i = _impl->locations->begin();
         i != _impl->locations->end(); ++i )
    {
        if( i->second == node )
            oids.push_back( i->first );
    }
    return oids;
}

}
