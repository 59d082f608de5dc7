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

// Serves an in-memory object directory
// Usage: see 'locusDirectory -h'

#include <locus/directoryServer.h>
#include <locus/init.h>
#include <locus/localDirectory.h>
#include <locus/nodeAddress.h>

#include <lunchbox/debug.h>
#include <lunchbox/log.h>

#include <boost/program_options.hpp>
#include <iostream>
#include <signal.h>

namespace po = boost::program_options;

namespace
{
static const uint16_t _defaultPort = 4240;
}

int main( int argc, char **argv )
{
    if( !locus::init( argc, argv ))
        return EXIT_FAILURE;

    std::string host;
    uint16_t port = _defaultPort;

    try // command line parsing
    {
        po::options_description options( "locusDirectory - Locus directory" );
        bool showHelp( false );

        options.add_options()
            ( "help,h", po::bool_switch( &showHelp )->default_value( false ),
              "show help message" )
            ( "host", po::value< std::string >( &host ),
              "listening interface, all interfaces if not set" )
            ( "port,p", po::value< uint16_t >( &port ), "listening port" );

        // parse program options
        po::variables_map variableMap;
        po::store( po::command_line_parser( argc, argv ).options(
                       options ).allow_unregistered().run(), variableMap );
        po::notify( variableMap );

        if( showHelp )
        {
            std::cout << options << std::endl;
            locus::exit();
            return EXIT_SUCCESS;
        }
    }
    catch( std::exception& exception )
    {
        std::cerr << "Command line parse error: " << exception.what()
                  << std::endl;
        locus::exit();
        return EXIT_FAILURE;
    }

    sigset_t signals;
    sigemptyset( &signals );
    sigaddset( &signals, SIGINT );
    sigaddset( &signals, SIGTERM );
    pthread_sigmask( SIG_BLOCK, &signals, 0 );

    locus::DirectoryPtr directory = new locus::LocalDirectory;
    locus::DirectoryServer server( directory );
    if( !server.listen( locus::NodeAddress( host, port )))
    {
        LBERROR << "Can't listen on port " << port << std::endl;
        locus::exit();
        return EXIT_FAILURE;
    }
    LBINFO << "Directory listening on " << server.getListenAddress()
           << std::endl;

    int received = 0;
    sigwait( &signals, &received );
    LBINFO << "Received signal " << received << ", shutting down"
           << std::endl;

    server.close();
    LBCHECK( locus::exit( ));
    return EXIT_SUCCESS;
}
