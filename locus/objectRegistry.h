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

#ifndef LOCUS_OBJECTREGISTRY_H
#define LOCUS_OBJECTREGISTRY_H

#include <locus/api.h>
#include <locus/types.h>

#include <boost/noncopyable.hpp>

namespace locus
{
namespace detail { class ObjectRegistry; }

/**
 * The objects resident on one kernel server.
 *
 * Maps identifiers to the active and frozen hosted objects of one node. All
 * methods are thread-safe, structural changes are atomic.
 */
class ObjectRegistry : public boost::noncopyable
{
public:
    /**
     * Construct a new, empty registry.
     *
     * @param host the address of the owning kernel server.
     * @param directory the directory allocating identifiers.
     * @param factory the factory instantiating application objects.
     * @version 1.0
     */
    LOCUS_API ObjectRegistry( const NodeAddress& host, DirectoryPtr directory,
                              ObjectFactory& factory );

    LOCUS_API virtual ~ObjectRegistry();

    /**
     * Create, initialize and register a new object.
     *
     * The object is instantiated and initialized first, then an identifier
     * located on this node is allocated.
     *
     * @return the identifier of the new, active object.
     * @throw Exception INSTANTIATION if the type is unknown or the object
     *        could not be initialized.
     * @throw Exception ALLOCATION if no identifier could be allocated.
     * @version 1.0
     */
    LOCUS_API OID create( const std::string& type, const Strings& args );

    /**
     * @return the hosted object for the given identifier.
     * @throw Exception NOT_FOUND if the object is not resident.
     * @version 1.0
     */
    LOCUS_API HostedObjectPtr lookup( const OID& oid ) const;

    /** @return the hosted object, or 0 if not resident. @version 1.0 */
    LOCUS_API HostedObjectPtr find( const OID& oid ) const;

    /**
     * Register an object received by migration.
     *
     * @throw Exception DESERIALIZATION if the snapshot can't be activated.
     * @throw Exception DUPLICATE if the object is already resident.
     * @version 1.0
     */
    LOCUS_API void insert( const OID& oid, const Snapshot& snapshot );

    /** Remove an object, if resident. @version 1.0 */
    LOCUS_API void remove( const OID& oid );

    /** @return the number of resident objects. @version 1.0 */
    LOCUS_API size_t size() const;

    /** @return the identifiers of all resident objects. @version 1.0 */
    LOCUS_API OIDs getIDs() const;

    /** Remove all objects. @version 1.0 */
    LOCUS_API void clear();

    /** @return the factory used to instantiate objects. @version 1.0 */
    LOCUS_API ObjectFactory& getFactory();

private:
    detail::ObjectRegistry* const _impl;
};
}

#endif // LOCUS_OBJECTREGISTRY_H
