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

#ifndef LOCUS_OBJECT_H
#define LOCUS_OBJECT_H

#include <locus/api.h>
#include <locus/types.h>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>

namespace locus
{
namespace detail { class Object; }

/**
 * A remotely invokable application object.
 *
 * Applications derive from this class, register their methods by name and
 * implement the serialization of their instance data, which is used to move
 * the object between kernel servers. Methods take and return strings, values
 * are converted by the application, e.g., using boost::lexical_cast.
 *
 * Methods may be invoked concurrently. An object is never serialized while
 * one of its methods executes.
 */
class Object : public boost::noncopyable
{
public:
    /** The signature of an invokable method. @version 1.0 */
    typedef boost::function< std::string( const Strings& ) > Method;

    /** Construct a new object. @version 1.0 */
    LOCUS_API Object();

    /** Destruct this object. @version 1.0 */
    LOCUS_API virtual ~Object();

    /**
     * Initialize a newly created object.
     *
     * Called once after instantiation on the creating kernel server, but not
     * after the object has been moved to another node. May throw to abort
     * the creation.
     *
     * @param args the creation arguments.
     * @version 1.0
     */
    virtual void init( const Strings& /*args*/ ) {}

    /**
     * Invoke the method of the given name.
     *
     * @return the result of the method.
     * @throw Exception INVOCATION if no such method exists, or any exception
     *        thrown by the method.
     * @version 1.0
     */
    LOCUS_API std::string invoke( const std::string& name,
                                  const Strings& args );

    /** @return true if a method of the given name exists. @version 1.0 */
    LOCUS_API bool hasMethod( const std::string& name ) const;

    /** @return the names of all registered methods. @version 1.0 */
    LOCUS_API Strings getMethodNames() const;

    /** @name Serialization */
    //@{
    /**
     * Serialize the instance data of this object.
     *
     * Throwing from this method aborts a migration, the object stays
     * resident and invokable.
     * @version 1.0
     */
    virtual void getInstanceData( DataOStream& os ) = 0;

    /**
     * Deserialize the instance data written by getInstanceData().
     *
     * Called on a newly instantiated object on the receiving node. All
     * written data has to be consumed.
     * @version 1.0
     */
    virtual void applyInstanceData( DataIStream& is ) = 0;
    //@}

protected:
    /**
     * Register a method.
     *
     * Methods have to be registered during construction. Registering an
     * existing name replaces the method.
     * @version 1.0
     */
    LOCUS_API void registerMethod( const std::string& name,
                                   const Method& method );

private:
    detail::Object* const _impl;
};
}
#endif // LOCUS_OBJECT_H
