// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "safe-markup/Markup.hxx"

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * A #Renderable without format specification support.
 */
struct BoldWidget final : SafeMarkup::Renderable {
	SafeMarkup::Markup ToMarkup() const override {
		return SafeMarkup::Markup{"<b>bold</b>"};
	}
};

/**
 * A #FormatRenderable which knows the "link" specification.
 */
struct UserWidget final : SafeMarkup::FormatRenderable {
	SafeMarkup::Markup ToMarkup() const override {
		return SafeMarkup::Markup{"<span>user</span>"};
	}

	SafeMarkup::Markup FormatMarkup(std::string_view spec) const override {
		if (spec == "link")
			return SafeMarkup::Markup{"<a href=\"/user/1\">user</a>"};

		throw std::invalid_argument("Unsupported format specification");
	}
};

/**
 * A plain host object with one attribute.
 */
struct Person final : SafeMarkup::Object {
	std::string name;

	explicit Person(std::string_view _name)
		:name(_name) {}

	std::string ToString() const override {
		return "Person " + name;
	}

	SafeMarkup::Value GetAttribute(std::string_view attribute) const override {
		if (attribute == "name")
			return name;

		return Object::GetAttribute(attribute);
	}
};

/**
 * A host object which also renders itself.
 */
struct Link final : SafeMarkup::Object, SafeMarkup::Renderable {
	std::string href;

	explicit Link(std::string_view _href)
		:href(_href) {}

	std::string ToString() const override {
		return href;
	}

	SafeMarkup::Value GetItem(std::string_view key) const override {
		if (key == "href")
			return href;

		return Object::GetItem(key);
	}

	SafeMarkup::Markup ToMarkup() const override {
		return SafeMarkup::Markup{"<a>link</a>"};
	}
};
