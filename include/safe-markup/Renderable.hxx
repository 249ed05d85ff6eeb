// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

namespace SafeMarkup {

class Markup;
class Value;

/**
 * An object which knows how to render itself as safe HTML.  Escaping
 * such an object returns its rendering verbatim.
 */
class Renderable {
public:
	virtual ~Renderable() noexcept = default;

	virtual Markup ToMarkup() const = 0;
};

/**
 * A #Renderable which can also render itself according to a format
 * specification, e.g. "{0:link}".
 */
class FormatRenderable : public Renderable {
public:
	/**
	 * Render this object for the given (non-empty) format
	 * specification.  The result is inserted without escaping.
	 * Implementations may throw if they do not support the
	 * specification; the exception reaches the caller unchanged.
	 */
	virtual Markup FormatMarkup(std::string_view spec) const = 0;
};

/**
 * A host object which has a textual representation and may be the
 * subject of "{0.name}" and "{0[key]}" lookups in format templates.
 * It may also implement #Renderable.
 */
class Object {
public:
	virtual ~Object() noexcept = default;

	/**
	 * The plain (not yet escaped) textual representation.
	 */
	virtual std::string ToString() const = 0;

	/**
	 * Look up an attribute.  The default implementation throws
	 * #FormatError.
	 */
	virtual Value GetAttribute(std::string_view name) const;

	/**
	 * Look up an item.  The default implementation throws
	 * #FormatError.
	 */
	virtual Value GetItem(std::string_view key) const;
};

} // namespace SafeMarkup
