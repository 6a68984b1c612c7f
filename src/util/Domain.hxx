// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef DOMAIN_HXX
#define DOMAIN_HXX

/**
 * A name for a subsystem, used as the prefix of log messages.
 * Instances are compared by address, so declare them "static
 * constexpr" once per subsystem.
 */
class Domain {
	const char *const name;

public:
	constexpr explicit Domain(const char *_name) noexcept
		:name(_name) {}

	Domain(const Domain &) = delete;
	Domain &operator=(const Domain &) = delete;

	constexpr const char *GetName() const noexcept {
		return name;
	}

	bool operator==(const Domain &other) const noexcept {
		return this == &other;
	}
};

#endif
