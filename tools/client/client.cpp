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

// Command line access to a Locus cluster
// Usage: see 'locusClient -h'

#include <locus/exception.h>
#include <locus/init.h>
#include <locus/nodeAddress.h>
#include <locus/peerClient.h>
#include <locus/remoteDirectory.h>

#include <lunchbox/debug.h>
#include <lunchbox/log.h>

#include <boost/program_options.hpp>
#include <iostream>

namespace po = boost::program_options;

namespace
{
int _usage( const po::options_description& options )
{
    std::cout << options << std::endl
              << "Commands:" << std::endl
              << "  create <node> <type> [args...]   create an object"
              << std::endl
              << "  invoke <oid> <method> [args...]  invoke a method"
              << std::endl
              << "  move <oid> <node>                move an object"
              << std::endl
              << "  resolve <oid>                    print the host of an "
              << "object" << std::endl
              << "  nodes [region]                   list the kernel servers"
              << std::endl;
    return EXIT_FAILURE;
}

locus::NodeAddress _toAddress( const std::string& string )
{
    locus::NodeAddress address;
    if( !address.fromString( string ))
        throw locus::Exception( locus::Exception::PROTOCOL,
                                "Invalid node address " + string );
    return address;
}

int _run( locus::PeerClient& client, const std::string& command,
          const locus::Strings& args )
{
    if( command == "create" && args.size() >= 2 )
    {
        const locus::Strings initArgs( args.begin() + 2, args.end( ));
        const locus::OID oid = client.createObject( _toAddress( args[0] ),
                                                    args[1], initArgs );
        std::cout << oid.getString() << std::endl;
        return EXIT_SUCCESS;
    }
    if( command == "invoke" && args.size() >= 2 )
    {
        const locus::Strings methodArgs( args.begin() + 2, args.end( ));
        std::cout << client.invoke( locus::OID( args[0] ), args[1],
                                    methodArgs ) << std::endl;
        return EXIT_SUCCESS;
    }
    if( command == "move" && args.size() == 2 )
    {
        client.moveObject( locus::OID( args[0] ), _toAddress( args[1] ));
        return EXIT_SUCCESS;
    }
    if( command == "resolve" && args.size() == 1 )
    {
        const locus::OID oid( args[0] );
        std::cout << client.getDirectory()->resolve( oid ) << std::endl;
        return EXIT_SUCCESS;
    }
    if( command == "nodes" && args.size() <= 1 )
    {
        const std::string region = args.empty() ? std::string() : args[0];
        const locus::NodeAddresses nodes =
            client.getDirectory()->getNodes( region );
        for( locus::NodeAddressesCIter i = nodes.begin(); i != nodes.end();
             ++i )
        {
            std::cout << *i << std::endl;
        }
        return EXIT_SUCCESS;
    }
    return -1;
}
}

int main( int argc, char **argv )
{
    if( !locus::init( argc, argv ))
        return EXIT_FAILURE;

    std::string directoryString;
    std::string command;
    locus::Strings args;

    po::options_description options( "locusClient - Locus command line client" );
    try // command line parsing
    {
        bool showHelp( false );

        options.add_options()
            ( "help,h", po::bool_switch( &showHelp )->default_value( false ),
              "show help message" )
            ( "directory,d", po::value< std::string >( &directoryString ),
              "directory server, format host[:port]" );

        po::options_description hidden;
        hidden.add_options()
            ( "command", po::value< std::string >( &command ), "command" )
            ( "args", po::value< locus::Strings >( &args ), "arguments" );

        po::options_description all;
        all.add( options ).add( hidden );

        po::positional_options_description positional;
        positional.add( "command", 1 ).add( "args", -1 );

        po::variables_map variableMap;
        po::store( po::command_line_parser( argc, argv ).options( all )
                       .positional( positional ).run(), variableMap );
        po::notify( variableMap );

        if( showHelp || directoryString.empty() || command.empty( ))
        {
            _usage( options );
            locus::exit();
            return showHelp ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }
    catch( std::exception& exception )
    {
        std::cerr << "Command line parse error: " << exception.what()
                  << std::endl;
        locus::exit();
        return EXIT_FAILURE;
    }

    int result = EXIT_FAILURE;
    try
    {
        locus::DirectoryPtr directory =
            new locus::RemoteDirectory( _toAddress( directoryString ));
        locus::PeerClient client( directory );
        result = _run( client, command, args );
        if( result < 0 )
            result = _usage( options );
    }
    catch( const locus::Exception& e )
    {
        std::cerr << e.what() << std::endl;
        result = EXIT_FAILURE;
    }

    locus::exit();
    return result;
}
