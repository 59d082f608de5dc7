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

// Hosts objects of the types in counter.h on one node
// Usage: see 'locusKernelServer -h'

#include "counter.h"

#include <locus/exception.h>
#include <locus/global.h>
#include <locus/init.h>
#include <locus/kernelServer.h>
#include <locus/nodeAddress.h>
#include <locus/remoteDirectory.h>

#include <lunchbox/debug.h>
#include <lunchbox/log.h>

#include <boost/program_options.hpp>
#include <iostream>
#include <signal.h>

namespace po = boost::program_options;

namespace
{
/** Block termination signals in all threads, they are handled by main. */
void _blockSignals( sigset_t& signals )
{
    sigemptyset( &signals );
    sigaddset( &signals, SIGINT );
    sigaddset( &signals, SIGTERM );
    pthread_sigmask( SIG_BLOCK, &signals, 0 );
}
}

int main( int argc, char **argv )
{
    if( !locus::init( argc, argv ))
        return EXIT_FAILURE;

    std::string host( "localhost" );
    uint16_t port = locus::Global::getDefaultPort();
    std::string directoryString;
    std::string region;
    bool skipRegistration( false );

    try // command line parsing
    {
        po::options_description options(
            "locusKernelServer - Locus kernel server" );
        bool showHelp( false );

        options.add_options()
            ( "help,h", po::bool_switch( &showHelp )->default_value( false ),
              "show help message" )
            ( "host", po::value< std::string >( &host ),
              "host name of this node, as seen by other nodes" )
            ( "port,p", po::value< uint16_t >( &port ), "listening port" )
            ( "directory,d", po::value< std::string >( &directoryString ),
              "directory server, format host[:port]" )
            ( "region,r", po::value< std::string >( &region ),
              "region of this node" )
            ( "skip-directory-registration",
              po::bool_switch( &skipRegistration )->default_value( false ),
              "do not register this node in the directory" )
            ( "locus-globals", po::value< std::string >(),
              "global attributes, see locus::Global::toString()" );

        // parse program options
        po::variables_map variableMap;
        po::store( po::command_line_parser( argc, argv ).options(
                       options ).allow_unregistered().run(), variableMap );
        po::notify( variableMap );

        if( showHelp || directoryString.empty( ))
        {
            std::cout << options << std::endl;
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

    if( port == 0 )
    {
        std::cerr << "The port of a kernel server must not be 0" << std::endl;
        locus::exit();
        return EXIT_FAILURE;
    }

    locus::NodeAddress directoryAddress;
    if( !directoryAddress.fromString( directoryString ))
    {
        std::cerr << "Invalid directory address " << directoryString
                  << std::endl;
        locus::exit();
        return EXIT_FAILURE;
    }

    sigset_t signals;
    _blockSignals( signals );

    locus::tools::Factory factory;
    locus::DirectoryPtr directory =
        new locus::RemoteDirectory( directoryAddress );
    locus::KernelServerPtr server =
        new locus::KernelServer( locus::NodeAddress( host, port ), directory,
                                 factory );

    if( !server->listen( ))
    {
        server = 0;
        locus::exit();
        return EXIT_FAILURE;
    }

    if( !skipRegistration )
    {
        try
        {
            server->registerWithDirectory( region );
        }
        catch( const locus::Exception& e )
        {
            LBERROR << "Registration with directory " << directoryAddress
                    << " failed: " << e.what() << std::endl;
            server->close();
            server = 0;
            locus::exit();
            return EXIT_FAILURE;
        }
    }

    int received = 0;
    sigwait( &signals, &received );
    LBINFO << "Received signal " << received << ", shutting down"
           << std::endl;

    server->close();
    server = 0;
    LBCHECK( locus::exit( ));
    return EXIT_SUCCESS;
}
