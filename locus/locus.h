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

#ifndef LOCUS_H
#define LOCUS_H

#include <locus/client.h>
#include <locus/commands.h>
#include <locus/connection.h>
#include <locus/dataIStream.h>
#include <locus/dataOStream.h>
#include <locus/directory.h>
#include <locus/directoryServer.h>
#include <locus/exception.h>
#include <locus/global.h>
#include <locus/hostedObject.h>
#include <locus/iCommand.h>
#include <locus/init.h>
#include <locus/kernelServer.h>
#include <locus/localDirectory.h>
#include <locus/log.h>
#include <locus/nodeAddress.h>
#include <locus/oCommand.h>
#include <locus/object.h>
#include <locus/objectFactory.h>
#include <locus/objectRegistry.h>
#include <locus/peer.h>
#include <locus/peerClient.h>
#include <locus/remoteDirectory.h>
#include <locus/remotePeer.h>
#include <locus/server.h>

/** @namespace locus Distributed object hosting and migration */

#endif // LOCUS_H
