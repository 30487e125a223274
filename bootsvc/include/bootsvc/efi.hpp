#pragma once

// based on UEFI 2.10 Errata A

#include <limits.h>
#include <stddef.h>
#include <stdint.h>

// 2.3.1 Data Types
using efi_status = size_t;
using efi_handle = void *;
using efi_event = void *;
using efi_tpl = size_t;
using efi_lba = uint64_t;
using efi_physical_addr = uint64_t;
using efi_virtual_addr = uint64_t;

struct alignas(8) efi_guid {
	uint32_t data1;
	uint16_t data2;
	uint16_t data3;
	uint8_t data4[8];

	friend constexpr bool operator==(const efi_guid &, const efi_guid &) = default;
};

static_assert(sizeof(efi_guid) == 16);

// 4.2.1 EFI_TABLE_HEADER

struct efi_table_header {
	uint64_t signature;
	uint32_t revision;
	uint32_t header_size;
	uint32_t crc32;
	uint32_t reserved;
};

constexpr uint64_t EFI_SYSTEM_TABLE_SIGNATURE = 0x5453595320494249;
constexpr uint64_t EFI_BOOT_SERVICES_SIGNATURE = 0x56524553544f4f42;

constexpr uint32_t efiRevision(uint32_t major, uint32_t minor) { return (major << 16) | minor; }

constexpr uint32_t EFI_1_02_SYSTEM_TABLE_REVISION = efiRevision(1, 2);
constexpr uint32_t EFI_1_10_SYSTEM_TABLE_REVISION = efiRevision(1, 10);
constexpr uint32_t EFI_2_00_SYSTEM_TABLE_REVISION = efiRevision(2, 0);
constexpr uint32_t EFI_2_10_SYSTEM_TABLE_REVISION = efiRevision(2, 100);

// 4.3.1 EFI_SYSTEM_TABLE

struct efi_boot_services;
struct efi_configuration_table;
struct efi_simple_text_input_protocol;
struct efi_simple_text_output_protocol;

struct efi_system_table {
	efi_table_header hdr;
	char16_t *firmware_vendor;
	uint32_t firmware_revision;
	efi_handle console_in_handle;
	efi_simple_text_input_protocol *con_in;
	efi_handle console_out_handle;
	efi_simple_text_output_protocol *con_out;
	efi_handle standard_error_handle;
	efi_simple_text_output_protocol *std_err;
	void *runtime_services;
	efi_boot_services *boot_services;
	size_t number_of_table_entries;
	efi_configuration_table *configuration_table;
};

// 4.6.1 EFI_CONFIGURATION_TABLE
struct efi_configuration_table {
	efi_guid vendor_guid;
	void *vendor_table;
};

constexpr efi_guid ACPI_TABLE_GUID = { 0xeb9d2d30, 0x2d88, 0x11d3, { 0x9a, 0x16, 0x00, 0x90, 0x27, 0x3f, 0xc1, 0x4d } };
constexpr efi_guid ACPI_20_TABLE_GUID = { 0x8868e871, 0xe4f1, 0x11d3, { 0xbc, 0x22, 0x00, 0x80, 0xc7, 0x3c, 0x88, 0x81 } };
constexpr efi_guid SAL_SYSTEM_TABLE_GUID = { 0xeb9d2d32, 0x2d88, 0x11d3, { 0x9a, 0x16, 0x00, 0x90, 0x27, 0x3f, 0xc1, 0x4d } };
constexpr efi_guid SMBIOS_TABLE_GUID = { 0xeb9d2d31, 0x2d88, 0x11d3, { 0x9a, 0x16, 0x00, 0x90, 0x27, 0x3f, 0xc1, 0x4d } };
constexpr efi_guid SMBIOS3_TABLE_GUID = { 0xf2fd1544, 0x9794, 0x4a2c, { 0x99, 0x2e, 0xe5, 0xbb, 0xcf, 0x20, 0xe3, 0x94 } };
constexpr efi_guid MPS_TABLE_GUID = { 0xeb9d2d2f, 0x2d88, 0x11d3, { 0x9a, 0x16, 0x00, 0x90, 0x27, 0x3f, 0xc1, 0x4d } };
constexpr efi_guid EFI_JSON_CONFIG_DATA_TABLE_GUID = { 0x87367f87, 0x1119, 0x41ce, { 0xaa, 0xec, 0x8b, 0xe0, 0x11, 0x1f, 0x55, 0x8a } };
constexpr efi_guid EFI_JSON_CAPSULE_DATA_TABLE_GUID = { 0x35e7a725, 0x8dd2, 0x4cac, { 0x80, 0x11, 0x33, 0xcd, 0xa8, 0x10, 0x90, 0x56 } };
constexpr efi_guid EFI_JSON_CAPSULE_RESULT_TABLE_GUID = { 0xdbc461c3, 0xb3de, 0x422a, { 0xb9, 0xb4, 0x98, 0x86, 0xfd, 0x49, 0xa1, 0xe5 } };
constexpr efi_guid EFI_DTB_TABLE_GUID = { 0xb1b621d5, 0xf19c, 0x41a5, { 0x83, 0x0b, 0xd9, 0x15, 0x2c, 0x69, 0xaa, 0xe0 } };
constexpr efi_guid EFI_RT_PROPERTIES_TABLE_GUID = { 0xeb66918a, 0x7eef, 0x402a, { 0x84, 0x2e, 0x93, 0x1d, 0x21, 0xc3, 0x8a, 0xe9 } };
constexpr efi_guid EFI_MEMORY_ATTRIBUTES_TABLE_GUID = { 0xdcfa911d, 0x26eb, 0x469f, { 0xa2, 0x20, 0x38, 0xb7, 0xdc, 0x46, 0x12, 0x20 } };

// 4.6.2 EFI_RT_PROPERTIES_TABLE

struct efi_rt_properties_table {
	uint16_t version;
	uint16_t length;
	uint32_t runtime_services_supported;
};

constexpr uint32_t EFI_RT_SUPPORTED_GET_TIME = 0x0001;
constexpr uint32_t EFI_RT_SUPPORTED_SET_TIME = 0x0002;
constexpr uint32_t EFI_RT_SUPPORTED_GET_WAKEUP_TIME = 0x0004;
constexpr uint32_t EFI_RT_SUPPORTED_SET_WAKEUP_TIME = 0x0008;
constexpr uint32_t EFI_RT_SUPPORTED_GET_VARIABLE = 0x0010;
constexpr uint32_t EFI_RT_SUPPORTED_GET_NEXT_VARIABLE_NAME = 0x0020;
constexpr uint32_t EFI_RT_SUPPORTED_SET_VARIABLE = 0x0040;
constexpr uint32_t EFI_RT_SUPPORTED_SET_VIRTUAL_ADDRESS_MAP = 0x0080;
constexpr uint32_t EFI_RT_SUPPORTED_CONVERT_POINTER = 0x0100;
constexpr uint32_t EFI_RT_SUPPORTED_GET_NEXT_HIGH_MONOTONIC_COUNT = 0x0200;
constexpr uint32_t EFI_RT_SUPPORTED_RESET_SYSTEM = 0x0400;
constexpr uint32_t EFI_RT_SUPPORTED_UPDATE_CAPSULE = 0x0800;
constexpr uint32_t EFI_RT_SUPPORTED_QUERY_CAPSULE_CAPABILITIES = 0x1000;
constexpr uint32_t EFI_RT_SUPPORTED_QUERY_VARIABLE_INFO = 0x2000;

// 7.1.1 EFI_BOOT_SERVICES.CreateEvent()

constexpr uint32_t EVT_TIMER = 0x80000000;
constexpr uint32_t EVT_RUNTIME = 0x40000000;
constexpr uint32_t EVT_NOTIFY_WAIT = 0x00000100;
constexpr uint32_t EVT_NOTIFY_SIGNAL = 0x00000200;
constexpr uint32_t EVT_SIGNAL_EXIT_BOOT_SERVICES = 0x00000201;
constexpr uint32_t EVT_SIGNAL_VIRTUAL_ADDRESS_CHANGE = 0x60000202;

using efi_event_notify = void (*)(efi_event event, void *context);

// 7.1.7 EFI_BOOT_SERVICES.SetTimer()
enum efi_timer_delay {
	TimerCancel,
	TimerPeriodic,
	TimerRelative
};

// 7.1.8 EFI_BOOT_SERVICES.RaiseTPL()

constexpr efi_tpl TPL_APPLICATION = 4;
constexpr efi_tpl TPL_CALLBACK = 8;
constexpr efi_tpl TPL_NOTIFY = 16;
constexpr efi_tpl TPL_HIGH_LEVEL = 31;

// 7.2.1 EFI_BOOT_SERVICES.AllocatePages()
enum efi_allocate_type {
	AllocateAnyPages,
	AllocateMaxAddress,
	AllocateAddress,
	MaxAllocateType
};

enum efi_memory_type {
	EfiReservedMemoryType,
	EfiLoaderCode,
	EfiLoaderData,
	EfiBootServicesCode,
	EfiBootServicesData,
	EfiRuntimeServicesCode,
	EfiRuntimeServicesData,
	EfiConventionalMemory,
	EfiUnusableMemory,
	EfiACPIReclaimMemory,
	EfiACPIMemoryNVS,
	EfiMemoryMappedIO,
	EfiMemoryMappedIOPortSpace,
	EfiPalCode,
	EfiPersistentMemory,
	EfiUnacceptedMemoryType,
	EfiMaxMemoryType
};

constexpr size_t EFI_PAGE_SIZE = 0x1000;

// 7.2.3 EFI_BOOT_SERVICES.GetMemoryMap()

struct efi_memory_descriptor {
	uint32_t type;
	efi_physical_addr physical_start;
	efi_virtual_addr virtual_start;
	uint64_t number_of_pages;
	uint64_t attribute;
};

constexpr uint32_t EFI_MEMORY_DESCRIPTOR_VERSION = 1;

constexpr uint64_t EFI_MEMORY_UC = 0x0000000000000001;
constexpr uint64_t EFI_MEMORY_WC = 0x0000000000000002;
constexpr uint64_t EFI_MEMORY_WT = 0x0000000000000004;
constexpr uint64_t EFI_MEMORY_WB = 0x0000000000000008;
constexpr uint64_t EFI_MEMORY_UCE = 0x0000000000000010;
constexpr uint64_t EFI_MEMORY_WP = 0x0000000000001000;
constexpr uint64_t EFI_MEMORY_RP = 0x0000000000002000;
constexpr uint64_t EFI_MEMORY_XP = 0x0000000000004000;
constexpr uint64_t EFI_MEMORY_NV = 0x0000000000008000;
constexpr uint64_t EFI_MEMORY_MORE_RELIABLE = 0x0000000000010000;
constexpr uint64_t EFI_MEMORY_RO = 0x0000000000020000;
constexpr uint64_t EFI_MEMORY_SP = 0x0000000000040000;
constexpr uint64_t EFI_MEMORY_CPU_CRYPTO = 0x0000000000080000;
constexpr uint64_t EFI_MEMORY_ISA_VALID = 0x4000000000000000;
constexpr uint64_t EFI_MEMORY_RUNTIME = 0x8000000000000000;

// 7.3.6 EFI_BOOT_SERVICES.LocateHandle()
enum efi_locate_search_type {
	AllHandles,
	ByRegisterNotify,
	ByProtocol
};

// 9.1.1 EFI_LOADED_IMAGE_PROTOCOL

struct efi_loaded_image_protocol {
	static constexpr efi_guid guid = {0x5B1B31A1, 0x9562, 0x11d2, {0x8E, 0x3F, 0x00, 0xA0, 0xC9, 0x69, 0x72, 0x3B}};

	uint32_t revision;
	efi_handle parent_handle;
	efi_system_table *system_table;
	efi_handle device_handle;
	void *file_path;
	void *reserved;
	uint32_t load_options_size;
	void *load_options;
	void *image_base;
	uint64_t image_size;
	efi_memory_type image_code_type;
	efi_memory_type image_data_type;
	void *unload;
};

// 10.2 EFI_DEVICE_PATH_PROTOCOL

struct efi_device_path_protocol {
	static constexpr efi_guid guid = { 0x09576e91, 0x6d3f, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b } };

	uint8_t type;
	uint8_t sub_type;
	uint8_t length[2];
};

// 12.3.1 EFI_SIMPLE_TEXT_INPUT_PROTOCOL

struct efi_input_key {
	uint16_t scan_code;
	char16_t unicode_char;
};

struct efi_simple_text_input_protocol {
	static constexpr efi_guid guid = { 0x387477c1, 0x69c7, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b } };

	efi_status (*reset)(efi_simple_text_input_protocol *self, bool extended_verification);
	efi_status (*read_key_stroke)(efi_simple_text_input_protocol *self, efi_input_key *key);
	efi_event wait_for_key;
};

// 12.4.1 EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL

struct efi_simple_text_output_mode {
	int32_t max_mode;
	int32_t mode;
	int32_t attribute;
	int32_t cursor_column;
	int32_t cursor_row;
	bool cursor_visible;
};

struct efi_simple_text_output_protocol {
	static constexpr efi_guid guid = { 0x387477c2, 0x69c7, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b } };

	efi_status (*reset)(efi_simple_text_output_protocol *self, bool extended_verification);
	efi_status (*output_string)(efi_simple_text_output_protocol *self, char16_t *string);
	efi_status (*test_string)(efi_simple_text_output_protocol *self, char16_t *string);
	efi_status (*query_mode)(efi_simple_text_output_protocol *self, size_t mode_number, size_t *columns, size_t *rows);
	efi_status (*set_mode)(efi_simple_text_output_protocol *self, size_t mode_number);
	efi_status (*set_attribute)(efi_simple_text_output_protocol *self, size_t attribute);
	efi_status (*clear_screen)(efi_simple_text_output_protocol *self);
	efi_status (*set_cursor_position)(efi_simple_text_output_protocol *self, size_t column, size_t row);
	efi_status (*enable_cursor)(efi_simple_text_output_protocol *self, bool visible);
	efi_simple_text_output_mode *mode;
};

// 12.9.2 EFI_GRAPHICS_OUTPUT_PROTOCOL

struct efi_pixel_bitmask {
	uint32_t red_mask;
	uint32_t green_mask;
	uint32_t blue_mask;
	uint32_t reserved_mask;
};

enum efi_graphics_pixel_format {
	PixelRedGreenBlueReserved8BitPerColor,
	PixelBlueGreenRedReserved8BitPerColor,
	PixelBitMask,
	PixelBltOnly,
	PixelFormatMax
};

struct efi_graphics_output_mode_information {
	uint32_t version;
	uint32_t horizontal_resolution;
	uint32_t vertical_resolution;
	efi_graphics_pixel_format pixel_format;
	efi_pixel_bitmask pixel_information;
	uint32_t pixels_per_scan_line;
};

struct efi_graphics_output_protocol_mode {
	uint32_t max_mode;
	uint32_t mode;
	efi_graphics_output_mode_information *info;
	size_t size_of_info;
	efi_physical_addr framebuffer_base;
	size_t framebuffer_size;
};

struct efi_graphics_output_blt_pixel {
	uint8_t blue;
	uint8_t green;
	uint8_t red;
	uint8_t reserved;
};

enum efi_graphics_output_blt_operation {
	EfiBltVideoFill,
	EfiBltVideoToBltBuffer,
	EfiBltBufferToVideo,
	EfiBltVideoToVideo,
	EfiGraphicsOutputBltOperationMax
};

struct efi_graphics_output_protocol {
	static constexpr efi_guid guid = { 0x9042a9de, 0x23dc, 0x4a38, { 0x96, 0xfb, 0x7a, 0xde, 0xd0, 0x80, 0x51, 0x6a } };

	efi_status (*query_mode)(efi_graphics_output_protocol *self, uint32_t mode_number, size_t *size_of_info, efi_graphics_output_mode_information **info);
	efi_status (*set_mode)(efi_graphics_output_protocol *self, uint32_t mode_number);
	efi_status (*blt)(efi_graphics_output_protocol *self, efi_graphics_output_blt_pixel *blt_buffer, efi_graphics_output_blt_operation blt_operation, size_t source_x, size_t source_y, size_t destination_x, size_t destination_y, size_t width, size_t height, size_t delta);
	efi_graphics_output_protocol_mode *mode;
};

// 12.9.3 EFI_EDID_*_PROTOCOL

struct efi_edid_discovered_protocol {
	static constexpr efi_guid guid = { 0x1c0c34f6, 0xd380, 0x41fa, { 0xa0, 0x49, 0x8a, 0xd0, 0x6c, 0x1a, 0x66, 0xaa } };

	uint32_t size_of_edid;
	uint8_t *edid;
};

struct efi_edid_active_protocol {
	static constexpr efi_guid guid = { 0xbd8c1056, 0x9f36, 0x44ec, { 0x92, 0xa8, 0xa6, 0x33, 0x7f, 0x81, 0x79, 0x86 } };

	uint32_t size_of_edid;
	uint8_t *edid;
};

constexpr uint32_t EFI_EDID_OVERRIDE_DONT_OVERRIDE = 0x01;
constexpr uint32_t EFI_EDID_OVERRIDE_ENABLE_HOT_PLUG = 0x02;

struct efi_edid_override_protocol {
	static constexpr efi_guid guid = { 0x48ecb431, 0xfb72, 0x45c0, { 0xa9, 0x22, 0xf4, 0x58, 0xfe, 0x04, 0x0b, 0xd5 } };

	efi_status (*get_edid)(efi_edid_override_protocol *self, efi_handle *child_handle, uint32_t *attributes, size_t *edid_size, uint8_t **edid);
};

// 13.9 EFI_BLOCK_IO_PROTOCOL

struct efi_block_io_media {
	uint32_t media_id;
	bool removable_media;
	bool media_present;
	bool logical_partition;
	bool read_only;
	bool write_caching;
	uint32_t block_size;
	uint32_t io_align;
	efi_lba last_block;

	// Revision 2 and later.
	efi_lba lowest_aligned_lba;
	uint32_t logical_blocks_per_physical_block;

	// Revision 3 and later.
	uint32_t optimal_transfer_length_granularity;
};

constexpr uint64_t EFI_BLOCK_IO_PROTOCOL_REVISION2 = 0x00020001;
constexpr uint64_t EFI_BLOCK_IO_PROTOCOL_REVISION3 = (2 << 16) | 31;

struct efi_block_io_protocol {
	static constexpr efi_guid guid = { 0x964e5b21, 0x6459, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b } };

	uint64_t revision;
	efi_block_io_media *media;
	efi_status (*reset)(efi_block_io_protocol *self, bool extended_verification);
	efi_status (*read_blocks)(efi_block_io_protocol *self, uint32_t media_id, efi_lba lba, size_t buffer_size, void *buffer);
	efi_status (*write_blocks)(efi_block_io_protocol *self, uint32_t media_id, efi_lba lba, size_t buffer_size, void *buffer);
	efi_status (*flush_blocks)(efi_block_io_protocol *self);
};

// Related Documents: RISC-V EFI Boot Protocol

struct riscv_efi_boot_protocol {
	static constexpr efi_guid guid = { 0xccd15fec, 0x6f73, 0x4eec, { 0x83, 0x95, 0x3e, 0x69, 0xe4, 0xb9, 0x40, 0xbf } };

	uint64_t revision;
	efi_status (*get_boot_hartid)(riscv_efi_boot_protocol *self, size_t *boot_hart_id);
};

// ------------------------------------------------------------------------------------------------
// These depend on declarations above, so they are placed last.
// ------------------------------------------------------------------------------------------------

// 4.4.1 EFI_BOOT_SERVICES

struct efi_boot_services {
	efi_table_header hdr;

	// Task Priority Services
	efi_tpl (*raise_tpl)(efi_tpl new_tpl);
	void (*restore_tpl)(efi_tpl old_tpl);

	// Memory Services
	efi_status (*allocate_pages)(efi_allocate_type type, efi_memory_type memory_type, size_t pages, efi_physical_addr *memory);
	efi_status (*free_pages)(efi_physical_addr memory, size_t pages);
	efi_status (*get_memory_map)(size_t *memory_map_size, efi_memory_descriptor *memory_map, size_t *map_key, size_t *descriptor_size, uint32_t *descriptor_version);
	efi_status (*allocate_pool)(efi_memory_type pool_type, size_t size, void **buffer);
	efi_status (*free_pool)(void *buffer);

	// Event & Timer Services
	efi_status (*create_event)(uint32_t type, efi_tpl notify_tpl, efi_event_notify notify_function, void *notify_context, efi_event *event);
	efi_status (*set_timer)(efi_event event, efi_timer_delay type, uint64_t trigger_time);
	efi_status (*wait_for_event)(size_t number_of_events, efi_event *event, size_t *index);
	efi_status (*signal_event)(efi_event event);
	efi_status (*close_event)(efi_event event);
	efi_status (*check_event)(efi_event event);

	// Protocol Handler Services
	void *install_protocol_interface;
	void *reinstall_protocol_interface;
	void *uninstall_protocol_interface;
	efi_status (*handle_protocol)(efi_handle handle, const efi_guid *protocol, void **interface);
	void *reserved;
	void *register_protocol_notify;
	efi_status (*locate_handle)(efi_locate_search_type search_type, const efi_guid *protocol, void *search_key, size_t *buffer_size, efi_handle *buffer);
	void *locate_device_path;
	void *install_configuration_table;

	// Image Services
	efi_status (*load_image)(bool boot_policy, efi_handle parent_image_handle, efi_device_path_protocol *device_path, void *source_buffer, size_t source_size, efi_handle *image_handle);
	efi_status (*start_image)(efi_handle image_handle, size_t *exit_data_size, char16_t **exit_data);
	efi_status (*exit)(efi_handle image_handle, efi_status exit_status, size_t exit_data_size, char16_t *exit_data);
	efi_status (*unload_image)(efi_handle image_handle);
	efi_status (*exit_boot_services)(efi_handle image_handle, size_t map_key);

	// Miscellaneous Services
	efi_status (*get_next_monotonic_count)(uint64_t *count);
	efi_status (*stall)(size_t microseconds);
	efi_status (*set_watchdog_timer)(size_t timeout, uint64_t watchdog_code, size_t data_size, char16_t *watchdog_data);

	// DriverSupport Services (EFI 1.1+)
	void *connect_controller;
	void *disconnect_controller;

	// Open and Close Protocol Services (EFI 1.1+)
	void *open_protocol;
	void *close_protocol;
	void *open_protocol_information;

	// Library Services (EFI 1.1+)
	void *protocols_per_handle;
	void *locate_handle_buffer;
	efi_status (*locate_protocol)(const efi_guid *protocol, void *registration, void **interface);
	void *install_multiple_protocol_interface;
	void *uninstall_multiple_protocol_interface;

	// 32-bit CRC Services (EFI 1.1+)
	void *calculate_crc32;

	// Miscellaneous Services (EFI 1.1+)
	void *copy_mem;
	void *set_mem;

	// EFI 2.0+
	void *create_event_ex;
};
