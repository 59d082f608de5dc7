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

#include "hostedObject.h"

#include "dataIStream.h"
#include "dataOStream.h"
#include "exception.h"
#include "log.h"
#include "object.h"
#include "objectFactory.h"

#include <lunchbox/atomic.h>
#include <lunchbox/debug.h>

#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace locus
{
namespace detail
{
class HostedObject
{
public:
    HostedObject( const OID& oid_, const std::string& type_,
                  locus::Object* object_, ObjectFactory& factory_ )
        : oid( oid_ )
        , type( type_ )
        , object( object_ )
        , factory( factory_ )
        , state( locus::HostedObject::STATE_INACTIVE )
    {}

    ~HostedObject()
    {
        factory.destroyObject( object, type );
    }

    bool isActive() const
    {
        return int32_t( state ) == locus::HostedObject::STATE_ACTIVE;
    }

    const OID oid;
    const std::string type;
    locus::Object* const object;
    ObjectFactory& factory;

    /**
     * Shared by invocations, exclusive for state changes. Invocations do not
     * wait for a pending state change.
     */
    boost::shared_mutex mutex;
    lunchbox::a_int32_t state;
    Snapshot snapshot; //!< retained while frozen
};

typedef boost::shared_lock< boost::shared_mutex > ReadLock;
typedef boost::unique_lock< boost::shared_mutex > WriteLock;
}

const uint32_t HostedObject::SNAPSHOT_MAGIC;
const uint32_t HostedObject::SNAPSHOT_VERSION;

HostedObject::HostedObject( const OID& oid, const std::string& type,
                            Object* object, ObjectFactory& factory )
    : _impl( new detail::HostedObject( oid, type, object, factory ))
{
    LBASSERT( object );
}

HostedObject::~HostedObject()
{
    delete _impl;
}

const OID& HostedObject::getOID() const
{
    return _impl->oid;
}

const std::string& HostedObject::getType() const
{
    return _impl->type;
}

HostedObject::State HostedObject::getState() const
{
    return State( int32_t( _impl->state ));
}

Object* HostedObject::getObject()
{
    return _impl->object;
}

void HostedObject::setActive()
{
    detail::WriteLock lock( _impl->mutex );
    if( getState() != STATE_INACTIVE )
        throw Exception( Exception::INVALID_STATE,
                         "Object " + _impl->oid.getString() +
                         " is not inactive" );
    _impl->state = STATE_ACTIVE;
}

std::string HostedObject::invoke( const std::string& method,
                                  const Strings& args )
{
    detail::ReadLock lock( _impl->mutex, boost::try_to_lock );
    if( !lock.owns_lock() || !_impl->isActive( ))
        throw Exception( Exception::INVALID_STATE,
                         "Object " + _impl->oid.getString() +
                         " is not active" );
    try
    {
        return _impl->object->invoke( method, args );
    }
    catch( const Exception& e )
    {
        if( e.getType() == Exception::INVOCATION )
            throw;
        throw Exception( Exception::INVOCATION, e.what( ));
    }
    catch( const std::exception& e )
    {
        throw Exception( Exception::INVOCATION, e.what( ));
    }
    catch( ... )
    {
        throw Exception( Exception::INVOCATION,
                         "Unknown exception in " + method );
    }
}

Snapshot HostedObject::freeze()
{
    detail::WriteLock lock( _impl->mutex );

    switch( getState( ))
    {
      case STATE_FROZEN:
          return _impl->snapshot;

      case STATE_INACTIVE:
          throw Exception( Exception::INVALID_STATE,
                           "Object " + _impl->oid.getString() +
                           " is not active" );
      case STATE_ACTIVE:
          break;
    }

    DataOStream os;
    try
    {
        DataOStream data;
        _impl->object->getInstanceData( data );
        os << SNAPSHOT_MAGIC << SNAPSHOT_VERSION << _impl->oid << _impl->type
           << data.toSnapshot();
    }
    catch( const std::exception& e )
    {
        LBWARN << "Serialization of " << *this << " failed: " << e.what()
               << std::endl;
        throw Exception( Exception::SERIALIZATION, e.what( ));
    }
    catch( ... )
    {
        LBWARN << "Serialization of " << *this << " failed" << std::endl;
        throw Exception( Exception::SERIALIZATION, "Unknown exception" );
    }

    _impl->snapshot = os.toSnapshot();
    _impl->state = STATE_FROZEN;
    LBLOG( LOG_OBJECTS ) << "Froze " << *this << ", "
                         << _impl->snapshot.size() << " bytes" << std::endl;
    return _impl->snapshot;
}

void HostedObject::thaw()
{
    detail::WriteLock lock( _impl->mutex );
    switch( getState( ))
    {
      case STATE_ACTIVE:
          return;

      case STATE_INACTIVE:
          throw Exception( Exception::INVALID_STATE,
                           "Object " + _impl->oid.getString() +
                           " is not frozen" );
      case STATE_FROZEN:
          break;
    }

    Snapshot().swap( _impl->snapshot );
    _impl->state = STATE_ACTIVE;
    LBLOG( LOG_OBJECTS ) << "Thawed " << *this << std::endl;
}

void HostedObject::deactivate()
{
    detail::WriteLock lock( _impl->mutex );
    Snapshot().swap( _impl->snapshot );
    _impl->state = STATE_INACTIVE;
}

HostedObjectPtr HostedObject::activate( const OID& oid,
                                        const Snapshot& snapshot,
                                        ObjectFactory& factory )
{
    try
    {
        DataIStream is( snapshot );
        const uint32_t magic = is.read< uint32_t >();
        if( magic != SNAPSHOT_MAGIC )
            throw Exception( Exception::DESERIALIZATION, "Bad snapshot magic" );

        const uint32_t version = is.read< uint32_t >();
        if( version != SNAPSHOT_VERSION )
        {
            std::ostringstream os;
            os << "Unsupported snapshot version " << version;
            throw Exception( Exception::DESERIALIZATION, os.str( ));
        }

        const OID snapshotOID = is.read< OID >();
        if( snapshotOID != oid )
            throw Exception( Exception::DESERIALIZATION,
                             "Snapshot of " + snapshotOID.getString() +
                             " received for " + oid.getString( ));

        const std::string type = is.read< std::string >();
        const std::vector< uint8_t > data = is.read< std::vector< uint8_t > >();
        if( is.hasData( ))
            throw Exception( Exception::DESERIALIZATION,
                             "Trailing data after snapshot" );

        Object* object = factory.createObject( type );
        if( !object )
            throw Exception( Exception::DESERIALIZATION,
                             "Unknown object type " + type );

        HostedObjectPtr hosted = new HostedObject( oid, type, object, factory );
        DataIStream dataStream( data );
        object->applyInstanceData( dataStream );
        if( dataStream.hasData( ))
            throw Exception( Exception::DESERIALIZATION,
                             "Unread instance data of type " + type );

        hosted->setActive();
        LBLOG( LOG_OBJECTS ) << "Activated " << *hosted << std::endl;
        return hosted;
    }
    catch( const Exception& e )
    {
        if( e.getType() == Exception::DESERIALIZATION )
            throw;
        throw Exception( Exception::DESERIALIZATION, e.what( ));
    }
    catch( const std::exception& e )
    {
        throw Exception( Exception::DESERIALIZATION, e.what( ));
    }
    catch( ... )
    {
        throw Exception( Exception::DESERIALIZATION, "Unknown exception" );
    }
}

std::ostream& operator << ( std::ostream& os, const HostedObject& object )
{
    const HostedObject::State state = object.getState();
    os << lunchbox::disableFlush << "HostedObject " << object.getOID() << " "
       << object.getType() << " "
       << ( state == HostedObject::STATE_INACTIVE ? "inactive" :
            state == HostedObject::STATE_ACTIVE   ? "active" :
                                                    "frozen" )
       << lunchbox::enableFlush;
    return os;
}

}
