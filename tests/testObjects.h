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

#ifndef LOCUS_TEST_OBJECTS_H
#define LOCUS_TEST_OBJECTS_H

// Application objects, factory and in-process cluster shared by the tests

#include <locus/dataIStream.h>
#include <locus/dataOStream.h>
#include <locus/exception.h>
#include <locus/global.h>
#include <locus/kernelServer.h>
#include <locus/localDirectory.h>
#include <locus/nodeAddress.h>
#include <locus/object.h>
#include <locus/objectFactory.h>
#include <locus/peerClient.h>

#include <lunchbox/atomic.h>
#include <lunchbox/lock.h>
#include <lunchbox/monitor.h>
#include <lunchbox/scopedMutex.h>

#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/lexical_cast.hpp>

#include <map>
#include <set>
#include <stdexcept>

namespace test
{
static const uint32_t ERROR_NONE = 0xffffffffu;

/** @return the Exception type thrown by the call, or ERROR_NONE. */
inline uint32_t getError( const boost::function< void() >& call )
{
    try
    {
        call();
    }
    catch( const locus::Exception& e )
    {
        return e.getType();
    }
    return ERROR_NONE;
}

/** An integer counter with a name. */
class Counter : public locus::Object
{
public:
    Counter() : _value( 0 )
    {
        registerMethod( "get", boost::bind( &Counter::_get, this, _1 ));
        registerMethod( "add", boost::bind( &Counter::_add, this, _1 ));
        registerMethod( "name", boost::bind( &Counter::_getName, this, _1 ));
        registerMethod( "fail", boost::bind( &Counter::_fail, this, _1 ));
        registerMethod( "panic", boost::bind( &Counter::_panic, this, _1 ));
    }

    void init( const locus::Strings& args ) override
    {
        if( args.size() > 0 )
        {
            if( args[0] == "fail" )
                throw std::runtime_error( "init failed on request" );
            if( args[0] == "panic" )
                throw 42;
            _value = boost::lexical_cast< int64_t >( args[0] );
        }
        if( args.size() > 1 )
            _name = args[1];
    }

    void getInstanceData( locus::DataOStream& os ) override
        { os << int64_t( _value ) << _name; }

    void applyInstanceData( locus::DataIStream& is ) override
        { _value = is.read< int64_t >(); is >> _name; }

private:
    lunchbox::Atomic< int64_t > _value;
    std::string _name;

    std::string _get( const locus::Strings& )
        { return boost::lexical_cast< std::string >( int64_t( _value )); }

    std::string _add( const locus::Strings& args )
    {
        int64_t sum = 0;
        for( locus::StringsCIter i = args.begin(); i != args.end(); ++i )
            sum += boost::lexical_cast< int64_t >( *i );
        return boost::lexical_cast< std::string >( _value += sum );
    }

    std::string _getName( const locus::Strings& ) { return _name; }

    std::string _fail( const locus::Strings& )
        { throw std::runtime_error( "Counter failure" ); }

    std::string _panic( const locus::Strings& ) { throw 42; }
};

/** Blocks in 'block' until released, used to test concurrent invocations. */
class Blocker : public locus::Object
{
public:
    Blocker()
    {
        registerMethod( "block", boost::bind( &Blocker::_block, this, _1 ));
        registerMethod( "ping", boost::bind( &Blocker::_ping, this, _1 ));
    }

    void getInstanceData( locus::DataOStream& ) override {}
    void applyInstanceData( locus::DataIStream& ) override {}

    static lunchbox::Monitor< uint32_t > entered; //!< blocked invocations
    static lunchbox::Monitor< bool > released;

private:
    std::string _block( const locus::Strings& )
    {
        ++entered;
        released.waitEQ( true );
        return "unblocked";
    }

    std::string _ping( const locus::Strings& ) { return "pong"; }
};

lunchbox::Monitor< uint32_t > Blocker::entered( 0 );
lunchbox::Monitor< bool > Blocker::released( false );

/** Fails to serialize its instance data. */
class Unserializable : public locus::Object
{
public:
    Unserializable()
    {
        registerMethod( "ping", boost::bind( &Unserializable::_ping, this,
                                             _1 ));
    }

    void getInstanceData( locus::DataOStream& ) override
        { throw std::runtime_error( "not serializable" ); }
    void applyInstanceData( locus::DataIStream& ) override {}

private:
    std::string _ping( const locus::Strings& ) { return "pong"; }
};

/** Writes more instance data than it reads. */
class Sloppy : public locus::Object
{
public:
    void getInstanceData( locus::DataOStream& os ) override
        { os << uint32_t( 1 ) << uint32_t( 2 ); }
    void applyInstanceData( locus::DataIStream& is ) override
        { is.read< uint32_t >(); }
};

/** Instantiates the test object types and counts live objects. */
class Factory : public locus::ObjectFactory
{
public:
    Factory() : nObjects( 0 ) {}

    locus::Object* createObject( const std::string& type ) override
    {
        locus::Object* object = 0;
        if( type == "Counter" )
            object = new Counter;
        else if( type == "Blocker" )
            object = new Blocker;
        else if( type == "Unserializable" )
            object = new Unserializable;
        else if( type == "Sloppy" )
            object = new Sloppy;

        if( object )
            ++nObjects;
        return object;
    }

    void destroyObject( locus::Object* object,
                        const std::string& type ) override
    {
        --nObjects;
        locus::ObjectFactory::destroyObject( object, type );
    }

    lunchbox::a_int32_t nObjects;
};

/** A directory which fails on request. */
class FlakyDirectory : public locus::Directory
{
public:
    FlakyDirectory()
        : local( new locus::LocalDirectory )
        , failAllocate( false )
        , failUpdates( 0 )
        , nUpdates( 0 )
    {}

    locus::OID allocate( const locus::NodeAddress& node ) override
    {
        if( failAllocate )
            throw locus::Exception( locus::Exception::DIRECTORY_UNAVAILABLE,
                                    "allocate" );
        return local->allocate( node );
    }

    locus::NodeAddress resolve( const locus::OID& oid ) override
        { return local->resolve( oid ); }

    void updateLocation( const locus::OID& oid,
                         const locus::NodeAddress& node ) override
    {
        ++nUpdates;
        if( failUpdates > 0 )
        {
            --failUpdates;
            throw locus::Exception( locus::Exception::DIRECTORY_UNAVAILABLE,
                                    "updateLocation" );
        }
        local->updateLocation( oid, node );
    }

    void registerNode( const locus::NodeAddress& node,
                       const std::string& region ) override
        { local->registerNode( node, region ); }

    locus::NodeAddresses getNodes( const std::string& region ) override
        { return local->getNodes( region ); }

    locus::LocalDirectoryPtr local;
    bool failAllocate;
    lunchbox::a_int32_t failUpdates; //!< number of updates to fail
    lunchbox::a_int32_t nUpdates;

protected:
    virtual ~FlakyDirectory() {}
};

typedef lunchbox::RefPtr< FlakyDirectory > FlakyDirectoryPtr;

/** Disturbs object transfers to relayed nodes. */
struct Interference
{
    Interference() : lostReplies( 0 ), hold( false ), held( 0 ) {}

    lunchbox::a_int32_t lostReplies; //!< installs whose reply is dropped
    lunchbox::Monitor< bool > hold; //!< transfers wait while set
    lunchbox::Monitor< uint32_t > held; //!< transfers which waited
};

/** Forwards requests to a kernel server, subject to interference. */
class Relay : public locus::Peer
{
public:
    Relay( locus::PeerPtr target, Interference& interference )
        : _target( target )
        , _interference( interference )
    {}

    locus::InvokeReply invoke( const locus::OID& oid,
                               const std::string& method,
                               const locus::Strings& args ) override
        { return _target->invoke( oid, method, args ); }

    void receiveMigratedObject( const locus::OID& oid,
                                const locus::Snapshot& snapshot ) override
    {
        if( _interference.hold.get( ))
        {
            ++_interference.held;
            _interference.hold.waitEQ( false );
        }

        _target->receiveMigratedObject( oid, snapshot );
        if( --_interference.lostReplies >= 0 )
            throw locus::Exception( locus::Exception::CONNECTION_LOST,
                                    "Reply dropped" );
        ++_interference.lostReplies;
    }

    locus::OID createObject( const std::string& type,
                             const locus::Strings& args ) override
        { return _target->createObject( type, args ); }

    void moveObject( const locus::OID& oid,
                     const locus::NodeAddress& destination ) override
        { _target->moveObject( oid, destination ); }

    locus::NodeAddress getAddress() const override
        { return _target->getAddress(); }

private:
    locus::PeerPtr _target;
    Interference& _interference;
};

/**
 * Kernel servers in one process, connected directly.
 *
 * Nodes can be marked unreachable to simulate network failures.
 */
class Cluster
{
public:
    Cluster( locus::DirectoryPtr directory_, locus::ObjectFactory& factory )
        : directory( directory_ )
        , _factory( factory )
    {
        locus::Global::setIAttribute(
            locus::Global::IATTR_DIRECTORY_RETRY_DELAY, 1 );
        locus::Global::setIAttribute(
            locus::Global::IATTR_TRANSFER_RETRY_DELAY, 1 );
        locus::Global::setIAttribute( locus::Global::IATTR_INVOKE_BACKOFF, 1 );
    }

    ~Cluster()
    {
        for( Servers::const_iterator i = _servers.begin();
             i != _servers.end(); ++i )
        {
            i->second->close();
        }
        _servers.clear();
    }

    locus::KernelServerPtr add( const std::string& name )
    {
        const locus::NodeAddress address( name, 4242 );
        locus::KernelServerPtr server =
            new locus::KernelServer( address, directory, _factory,
                                     boost::bind( &Cluster::connect, this,
                                                  _1 ));
        server->registerWithDirectory( std::string( ));
        lunchbox::ScopedWrite mutex( _lock );
        _servers[ address ] = server;
        return server;
    }

    locus::PeerPtr connect( const locus::NodeAddress& address )
    {
        lunchbox::ScopedWrite mutex( _lock );
        if( _down.find( address ) != _down.end( ))
            return 0;
        Servers::const_iterator i = _servers.find( address );
        if( i == _servers.end( ))
            return 0;
        if( _relayed.find( address ) != _relayed.end( ))
            return new Relay( i->second.get(), interference );
        return i->second.get();
    }

    /** Route all new connections to the node through a Relay. */
    void relay( const locus::NodeAddress& address )
    {
        Servers servers;
        {
            lunchbox::ScopedWrite mutex( _lock );
            _relayed.insert( address );
            servers = _servers;
        }
        _release( servers, address );
    }

    /** Disconnects all cached connections to the node when disabled. */
    void setReachable( const locus::NodeAddress& address, const bool on )
    {
        Servers servers;
        {
            lunchbox::ScopedWrite mutex( _lock );
            if( on )
            {
                _down.erase( address );
                return;
            }
            _down.insert( address );
            servers = _servers;
        }
        _release( servers, address );
    }

    locus::DirectoryPtr directory;
    Interference interference;

private:
    typedef std::map< locus::NodeAddress, locus::KernelServerPtr > Servers;

    static void _release( const Servers& servers,
                          const locus::NodeAddress& address )
    {
        for( Servers::const_iterator i = servers.begin(); i != servers.end();
             ++i )
        {
            i->second->getPeerClient().releasePeer( address );
        }
    }

    locus::ObjectFactory& _factory;
    lunchbox::Lock _lock;
    Servers _servers;
    std::set< locus::NodeAddress > _down;
    std::set< locus::NodeAddress > _relayed;
};
}

#endif // LOCUS_TEST_OBJECTS_H
