#pragma once

#include <optional>
#include <span>

#include <bootsvc/efi.hpp>

namespace bootsvc {

// Vendor tables that firmware publishes through the system table.
struct ConfigTable {
	ConfigTable() = default;

	explicit ConfigTable(std::span<const efi_configuration_table> entries)
	: entries_{entries} { }

	size_t size() const { return entries_.size(); }
	const efi_configuration_table &operator[](size_t n) const { return entries_[n]; }

	auto begin() const { return entries_.begin(); }
	auto end() const { return entries_.end(); }

	// Returns the table of the first entry whose GUID matches.
	std::optional<void *> find(const efi_guid &guid) const;

	template<typename T>
	std::optional<T *> findAs(const efi_guid &guid) const {
		auto table = find(guid);
		if (!table)
			return std::nullopt;
		return static_cast<T *>(*table);
	}

private:
	std::span<const efi_configuration_table> entries_;
};

// Logs the GUIDs of all tables that are known by name.
void logConfigTable(const ConfigTable &table);

} // namespace bootsvc
