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

// Tests directory and kernel servers communicating over TCP on localhost

#include "testObjects.h"

#include <lunchbox/test.h>

#include <locus/client.h>
#include <locus/commands.h>
#include <locus/connection.h>
#include <locus/directoryServer.h>
#include <locus/iCommand.h>
#include <locus/init.h>
#include <locus/kernelServer.h>
#include <locus/oCommand.h>
#include <locus/objectRegistry.h>
#include <locus/peerClient.h>
#include <locus/remoteDirectory.h>
#include <locus/remotePeer.h>

using test::getError;

namespace
{
const std::string localhost( "127.0.0.1" );

locus::NodeAddress _getFreeAddress()
{
    locus::ConnectionPtr connection =
        locus::Connection::create( locus::NodeAddress( localhost, 0 ));
    TEST( connection->listen( ));
    const locus::NodeAddress address = connection->getAddress();
    connection->close();
    TEST( address.port != 0 );
    return address;
}

/** @return the error type of a raw request to the given server. */
uint32_t _sendRaw( const locus::NodeAddress& address, const uint32_t cmd )
{
    locus::Client client( address );
    locus::OCommand request( cmd );
    request << uint32_t( 42 );
    locus::ICommand reply( 0, client.call( request ));
    return getError( boost::bind( &locus::Client::checkReply,
                                  boost::ref( reply )));
}
}

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));
    locus::Global::setIAttribute( locus::Global::IATTR_DIRECTORY_RETRY_DELAY,
                                  1 );
    locus::Global::setIAttribute( locus::Global::IATTR_TRANSFER_RETRY_DELAY,
                                  1 );
    locus::Global::setIAttribute( locus::Global::IATTR_INVOKE_BACKOFF, 1 );
    locus::Global::setIAttribute( locus::Global::IATTR_INVOKE_RETRIES, 3 );

    test::Factory factory;
    locus::LocalDirectoryPtr local = new locus::LocalDirectory;
    locus::DirectoryServer directoryServer( local );
    TEST( directoryServer.listen( locus::NodeAddress( localhost, 0 )));
    TEST( directoryServer.isListening( ));
    const locus::NodeAddress directoryAddress =
        directoryServer.getListenAddress();
    TEST( directoryAddress.port != 0 );
    {
        locus::DirectoryPtr directory =
            new locus::RemoteDirectory( directoryAddress );
        locus::KernelServerPtr node1 =
            new locus::KernelServer( _getFreeAddress(), directory, factory );
        locus::KernelServerPtr node2 =
            new locus::KernelServer( _getFreeAddress(), directory, factory );
        TEST( node1->listen( ));
        TEST( node2->listen( ));

        // an ephemeral port can't be published in the directory
        locus::KernelServerPtr ephemeral =
            new locus::KernelServer( locus::NodeAddress( localhost, 0 ),
                                     directory, factory );
        TEST( !ephemeral->listen( ));
        TEST( !ephemeral->isListening( ));
        ephemeral = 0;
        node1->registerWithDirectory( "test" );
        node2->registerWithDirectory( "other" );

        TEST( directory->getNodes( std::string( )).size() == 2 );
        const locus::NodeAddresses nodes = directory->getNodes( "test" );
        TEST( nodes.size() == 1 );
        TEST( nodes[0] == node1->getAddress( ));

        locus::PeerClient client( directory );

        // create, invoke and move through the network
        const locus::Strings args( 1, "3" );
        const locus::Strings noArgs;
        const locus::OID oid =
            client.createObject( node1->getAddress(), "Counter", args );
        TEST( local->resolve( oid ) == node1->getAddress( ));
        TEST( directory->resolve( oid ) == node1->getAddress( ));
        TEST( node1->getRegistry().size() == 1 );
        TEST( client.invoke( oid, "add", args ) == "6" );

        client.moveObject( oid, node2->getAddress( ));
        TEST( local->resolve( oid ) == node2->getAddress( ));
        TEST( node1->getRegistry().size() == 0 );
        TEST( node2->getRegistry().size() == 1 );
        TEST( client.invoke( oid, "get", noArgs ) == "6" );

        // a stale cache entry is corrected over the network
        client.setLocation( oid, node1->getAddress( ));
        TEST( client.invoke( oid, "add", args ) == "9" );
        TEST( client.resolve( oid ) == node2->getAddress( ));

        // remote errors keep their type
        TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                     std::string( "fail" ), noArgs )) ==
              locus::Exception::REMOTE_INVOCATION );
        TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                     std::string( "panic" ), noArgs )) ==
              locus::Exception::REMOTE_INVOCATION );
        TEST( client.invoke( oid, "get", noArgs ) == "9" );

        const locus::OID unknown = servus::make_UUID();
        TEST( getError( boost::bind( &locus::Directory::resolve,
                                     directory.get(), unknown )) ==
              locus::Exception::UNKNOWN_OID );

        locus::PeerPtr peer = locus::RemotePeer::create( node1->getAddress( ));
        TEST( getError( boost::bind( &locus::Peer::moveObject, peer.get(),
                                     oid, node2->getAddress( ))) ==
              locus::Exception::NOT_FOUND );
        TEST( getError( boost::bind( &locus::Peer::createObject, peer.get(),
                                     std::string( "Unknown" ), noArgs )) ==
              locus::Exception::INSTANTIATION );
        locus::InvokeReply reply = peer->invoke( oid, "get", noArgs );
        TEST( reply.status == locus::InvokeReply::STATUS_NOT_HERE );
        peer = 0;

        TEST( _sendRaw( node1->getAddress(), locus::CMD_KERNEL_CUSTOM ) ==
              locus::Exception::PROTOCOL );
        TEST( _sendRaw( directoryAddress, locus::CMD_DIRECTORY_CUSTOM ) ==
              locus::Exception::PROTOCOL );
        TEST( _sendRaw( node1->getAddress(), locus::CMD_KERNEL_MOVE_OBJECT ) ==
              locus::Exception::DESERIALIZATION );

        // nodes going away
        node2->close();
        TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                     std::string( "get" ), noArgs )) ==
              locus::Exception::CONNECTION_LOST );
        TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                     std::string( "get" ), noArgs )) ==
              locus::Exception::NOT_FOUND );

        const locus::OID second = node1->createObject( "Counter", args );
        TEST( getError( boost::bind( &locus::KernelServer::moveObject,
                                     node1.get(), second,
                                     node2->getAddress( ))) ==
              locus::Exception::TRANSFER );
        TEST( node1->getRegistry().lookup( second )->isFrozen( ));
        node1->reactivateObject( second );
        TEST( client.invoke( second, "get", noArgs ) == "3" );

        // the directory going away
        directoryServer.close();
        TEST( getError( boost::bind( &locus::KernelServer::createObject,
                                     node1.get(), std::string( "Counter" ),
                                     noArgs )) ==
              locus::Exception::ALLOCATION );
        TEST( getError( boost::bind( &locus::Directory::getNodes,
                                     directory.get(), std::string( ))) ==
              locus::Exception::DIRECTORY_UNAVAILABLE );
        TEST( node1->getRegistry().size() == 1 );

        client.clear();
        node1->close();
        node2->close();
    }
    TESTINFO( int32_t( factory.nObjects ) == 0, int32_t( factory.nObjects ));

    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
