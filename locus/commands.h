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

#ifndef LOCUS_COMMANDS_H
#define LOCUS_COMMANDS_H

#include <lunchbox/types.h>

namespace locus
{
/** The commands of the kernel server and the directory protocol. */
enum Commands
{
    CMD_KERNEL_INVOKE,              //!< oid, method, args -> InvokeReply
    CMD_KERNEL_RECEIVE_OBJECT,      //!< oid, snapshot -> void
    CMD_KERNEL_CREATE_OBJECT,       //!< type, args -> oid
    CMD_KERNEL_MOVE_OBJECT,         //!< oid, destination -> void
    CMD_KERNEL_CUSTOM = 20,

    CMD_DIRECTORY_ALLOCATE = 30,    //!< node -> oid
    CMD_DIRECTORY_RESOLVE,          //!< oid -> node
    CMD_DIRECTORY_UPDATE_LOCATION,  //!< oid, node -> void
    CMD_DIRECTORY_REGISTER_NODE,    //!< node, region -> void
    CMD_DIRECTORY_GET_NODES,        //!< region -> nodes
    CMD_DIRECTORY_CUSTOM = 50,

    CMD_REPLY = 100,                //!< ReplyStatus, payload or error
    CMD_INVALID = 0xFFFFFFFFu       //!< @internal
};

/** The status of a CMD_REPLY. */
enum ReplyStatus
{
    REPLY_OK,   //!< followed by the payload of the request
    REPLY_ERROR //!< followed by the Exception type and message
};

/** @internal Largest accepted command, protects against corrupt headers. */
static const uint64_t COMMAND_MAXSIZE = 256 * LB_1MB;
}

#endif // LOCUS_COMMANDS_H
