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

#include "objectRegistry.h"

#include "directory.h"
#include "exception.h"
#include "hostedObject.h"
#include "log.h"
#include "nodeAddress.h"
#include "object.h"
#include "objectFactory.h"

#include <lunchbox/debug.h>
#include <lunchbox/lockable.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/spinLock.h>
#include <lunchbox/stdExt.h>

namespace locus
{
namespace detail
{
typedef stde::hash_map< OID, HostedObjectPtr > ObjectHash;
typedef ObjectHash::const_iterator ObjectHashCIter;

class ObjectRegistry
{
public:
    ObjectRegistry( const NodeAddress& host_, DirectoryPtr directory_,
                    ObjectFactory& factory_ )
        : host( host_ )
        , directory( directory_ )
        , factory( factory_ )
    {}

    const NodeAddress host;
    DirectoryPtr directory;
    ObjectFactory& factory;

    lunchbox::Lockable< ObjectHash, lunchbox::SpinLock > objects;
};
}

ObjectRegistry::ObjectRegistry( const NodeAddress& host,
                                DirectoryPtr directory,
                                ObjectFactory& factory )
    : _impl( new detail::ObjectRegistry( host, directory, factory ))
{
    LBASSERT( directory );
}

ObjectRegistry::~ObjectRegistry()
{
    clear();
    delete _impl;
}

ObjectFactory& ObjectRegistry::getFactory()
{
    return _impl->factory;
}

OID ObjectRegistry::create( const std::string& type, const Strings& args )
{
    Object* object = _impl->factory.createObject( type );
    if( !object )
        throw Exception( Exception::INSTANTIATION, "Unknown type " + type );

    try
    {
        object->init( args );
    }
    catch( const std::exception& e )
    {
        _impl->factory.destroyObject( object, type );
        LBWARN << "Initialization of " << type << " failed: " << e.what()
               << std::endl;
        throw Exception( Exception::INSTANTIATION, e.what( ));
    }
    catch( ... )
    {
        _impl->factory.destroyObject( object, type );
        LBWARN << "Initialization of " << type << " failed" << std::endl;
        throw Exception( Exception::INSTANTIATION,
                         "Unknown exception in init of " + type );
    }

    OID oid;
    try
    {
        oid = _impl->directory->allocate( _impl->host );
    }
    catch( const std::exception& e )
    {
        _impl->factory.destroyObject( object, type );
        LBWARN << "Identifier allocation for " << type << " failed: "
               << e.what() << std::endl;
        throw Exception( Exception::ALLOCATION, e.what( ));
    }

    HostedObjectPtr hosted = new HostedObject( oid, type, object,
                                               _impl->factory );
    hosted->setActive();
    {
        lunchbox::ScopedFastWrite mutex( _impl->objects );
        LBASSERT( _impl->objects->find( oid ) == _impl->objects->end( ));
        (*_impl->objects)[ oid ] = hosted;
    }
    LBLOG( LOG_OBJECTS ) << "Created " << *hosted << std::endl;
    return oid;
}

HostedObjectPtr ObjectRegistry::find( const OID& oid ) const
{
    lunchbox::ScopedFastRead mutex( _impl->objects );
    detail::ObjectHashCIter i = _impl->objects->find( oid );
    if( i == _impl->objects->end( ))
        return 0;
    return i->second;
}

HostedObjectPtr ObjectRegistry::lookup( const OID& oid ) const
{
    HostedObjectPtr hosted = find( oid );
    if( !hosted )
        throw Exception( Exception::NOT_FOUND, oid.getString( ));
    return hosted;
}

void ObjectRegistry::insert( const OID& oid, const Snapshot& snapshot )
{
    HostedObjectPtr hosted = HostedObject::activate( oid, snapshot,
                                                     _impl->factory );

    lunchbox::ScopedFastWrite mutex( _impl->objects );
    if( _impl->objects->find( oid ) != _impl->objects->end( ))
    {
        LBWARN << "Object " << oid << " already resident" << std::endl;
        throw Exception( Exception::DUPLICATE, oid.getString( ));
    }
    (*_impl->objects)[ oid ] = hosted;
    LBLOG( LOG_OBJECTS ) << "Inserted " << *hosted << std::endl;
}

void ObjectRegistry::remove( const OID& oid )
{
    HostedObjectPtr hosted;
    {
        lunchbox::ScopedFastWrite mutex( _impl->objects );
        detail::ObjectHash::iterator i = _impl->objects->find( oid );
        if( i == _impl->objects->end( ))
            return;

        hosted = i->second;
        _impl->objects->erase( i );
    }
    hosted->deactivate();
    LBLOG( LOG_OBJECTS ) << "Removed " << *hosted << std::endl;
}

size_t ObjectRegistry::size() const
{
    lunchbox::ScopedFastRead mutex( _impl->objects );
    return _impl->objects->size();
}

OIDs ObjectRegistry::getIDs() const
{
    OIDs oids;
    lunchbox::ScopedFastRead mutex( _impl->objects );
    oids.reserve( _impl->objects->size( ));
    for( detail::ObjectHashCIter i = _impl->objects->begin();
         i != _impl->objects->end(); ++i )
    {
        oids.push_back( i->first );
    }
    return oids;
}

void ObjectRegistry::clear()
{
    detail::ObjectHash objects;
    {
        lunchbox::ScopedFastWrite mutex( _impl->objects );
        _impl->objects->swap( objects );
    }
}

}
