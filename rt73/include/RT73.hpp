// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Region.hpp>

#include <array>
#include <cstdint>
#include <span>

namespace rt73map {

using namespace Layout;
using std::literals::operator""sv;

// Image read and written in 2 KiB blocks. The contact, zone and channel
// tables follow the device layout of a codeplug holding full tables.
inline constexpr std::uint32_t codeplug_size = 0x28000;

inline constexpr std::uint32_t message_size = 40;
inline constexpr std::uint32_t contact_capacity = 1024;
inline constexpr std::uint32_t zone_capacity = 64;
inline constexpr std::uint32_t channel_capacity = 1024;
inline constexpr std::uint32_t scan_list_capacity = 250;
inline constexpr std::uint32_t rx_group_capacity = 250;

inline constexpr std::uint32_t contact_db_base = 0x01000000;
inline constexpr std::uint32_t contact_db_capacity = 300000;
inline constexpr std::uint32_t group_db_base = 0x04000000;
inline constexpr std::uint32_t group_db_capacity = 30000;
inline constexpr std::uint32_t bulk_header_size = 16;
inline constexpr std::uint32_t max_bulk_record_size = 128;

// CTCSS tones in 0.1 Hz
inline constexpr std::array<std::uint16_t, 51> ctcss_tones{
    625,  670,  693,  719,  744,  770,  797,  825,  854,  885,  915,
    948,  974,  1000, 1035, 1072, 1109, 1148, 1188, 1230, 1273, 1318,
    1365, 1413, 1462, 1514, 1567, 1598, 1622, 1655, 1679, 1713, 1738,
    1773, 1799, 1835, 1862, 1899, 1928, 1966, 1995, 2035, 2065, 2107,
    2181, 2257, 2291, 2336, 2418, 2503, 2541};

// DCS codes as printed on the radio (octal digits)
inline constexpr std::array<std::uint16_t, 108> dcs_codes{
    17, 23, 25, 26, 31, 32, 36, 43, 47, 50, 51, 53, 54,
    65, 71, 72, 73, 74, 114, 115, 116, 122, 125, 131, 132, 134,
    143, 145, 152, 155, 156, 162, 165, 172, 174, 205, 212, 223, 225,
    226, 243, 244, 245, 246, 251, 252, 255, 261, 263, 265, 266, 271,
    274, 306, 311, 315, 325, 331, 332, 343, 346, 351, 356, 364, 365,
    371, 411, 412, 413, 423, 431, 432, 445, 446, 452, 454, 455, 462,
    464, 465, 466, 503, 506, 516, 523, 526, 532, 546, 565, 606, 612,
    624, 627, 631, 632, 645, 646, 654, 662, 664, 703, 712, 723, 731,
    732, 734, 743, 754};

// Choice tables

inline constexpr std::array<Option, 2> languages{
    {{0x00, "CHINESE"sv}, {0x10, "ENGLISH"sv}}};
inline constexpr std::array<Option, 3> backlight_modes{
    {{0x00, "OFF"sv}, {0x08, "ON"sv}, {0x20, "AUTO"sv}}};
inline constexpr std::array<Option, 4> keylock_modes{{{0x00, "OFF"sv},
                                                      {0x04, "AUTO"sv},
                                                      {0x40, "MANUAL"sv},
                                                      {0x44, "MANUAL_AUTO"sv}}};
inline constexpr std::array<Option, 2> tone_profiles{
    {{0x00, "STANDARD"sv}, {0x01, "SILENT"sv}}};
inline constexpr std::array<Option, 3> scan_modes{
    {{0x00, "CARRIER"sv}, {0x01, "TIME"sv}, {0x02, "SEARCH"sv}}};
inline constexpr std::array<Option, 3> roaming_modes{
    {{0x00, "AUTO"sv}, {0x01, "MANUAL"sv}, {0x02, "STRONG_RSSI"sv}}};
// squelch tail elimination phase
inline constexpr std::array<Option, 4> end_tones{{{0x00, "55HZ"sv},
                                                  {0x01, "120_DEG"sv},
                                                  {0x02, "180_DEG"sv},
                                                  {0x03, "240_DEG"sv}}};
inline constexpr std::array<Option, 4> record_modes{
    {{0x00, "NONE"sv}, {0x01, "TX"sv}, {0x02, "RX"sv}, {0x03, "TX_RX"sv}}};
inline constexpr std::array<Option, 2> hang_up_tones{
    {{0x00, "SILENT"sv}, {0x01, "PROMPT_TONE"sv}}};
inline constexpr std::array<Option, 10> long_press_durations{
    {{0x00, "0.5S"sv},
     {0x01, "1.0S"sv},
     {0x02, "1.5S"sv},
     {0x03, "2.0S"sv},
     {0x04, "2.5S"sv},
     {0x05, "3.0S"sv},
     {0x06, "3.5S"sv},
     {0x07, "4.0S"sv},
     {0x08, "4.5S"sv},
     {0x09, "5.0S"sv}}};

inline constexpr std::array<Option, 33> button_functions{
    {{0x00, "UNDEFINED"sv},         {0x01, "HI_LO_POWER"sv},
     {0x02, "BACKLIGHT_TOGGLE"sv},  {0x03, "KEYLOCK_TOGGLE"sv},
     {0x04, "VOX"sv},               {0x05, "ZONE_SWITCH"sv},
     {0x06, "SCAN"sv},              {0x07, "SCAN_MODE_TOGGLE"sv},
     {0x08, "RPTR_TALKAROUND"sv},   {0x09, "EMERGENCY_ALARM"sv},
     {0x0A, "ENCRYPTION_TOGGLE"sv}, {0x0B, "CONTACTS"sv},
     {0x0C, "SMS"sv},               {0x0D, "RADIO_REVIVE"sv},
     {0x0E, "RADIO_DETECTION"sv},   {0x0F, "RADIO_KILL"sv},
     {0x10, "REMOTE_MONITOR"sv},    {0x11, "MONITOR"sv},
     {0x12, "PERMANENT_MONITOR"sv}, {0x13, "TONEBURST_1750HZ"sv},
     {0x1B, "GPS_TOGGLE"sv},        {0x28, "MENU"sv},
     {0x31, "DTMF_TOGGLE"sv},       {0x34, "ROAM_TOGGLE"sv},
     {0x37, "UP"sv},                {0x38, "DOWN"sv},
     {0x39, "BACK"sv},              {0x3A, "DQT_QT"sv},
     {0x3B, "A_B_TOGGLE"sv},        {0x3C, "VOL"sv},
     {0x3D, "VFO"sv},               {0x3E, "MANDATORY_MONITOR"sv},
     {0x3F, "DUAL_WATCH_TOGGLE"sv}}};

inline constexpr std::array<Option, 4> channel_modes{{{0x00, "ANALOG"sv},
                                                      {0x40, "DIGITAL"sv},
                                                      {0x80, "D_A_TX_A"sv},
                                                      {0xC0, "D_A_TX_D"sv}}};
inline constexpr std::array<Option, 2> tx_powers{
    {{0x00, "LOW"sv}, {0x20, "HIGH"sv}}};
inline constexpr std::array<Option, 2> bandwidths{
    {{0x00, "12.5KHZ"sv}, {0x10, "25KHZ"sv}}};
inline constexpr std::array<Option, 2> pct_modes{
    {{0x00, "PATCS"sv}, {0x02, "OACSU"sv}}};
inline constexpr std::array<Option, 2> rx_timeslots{
    {{0x00, "TS1"sv}, {0x01, "TS2"sv}}};
inline constexpr std::array<Option, 2> tx_timeslots{
    {{0x00, "TS1"sv}, {0x02, "TS2"sv}}};
inline constexpr std::array<Option, 3> tx_policies{
    {{0x00, "IMPOLITE"sv}, {0x40, "POLITE_TO_CC"sv}, {0x80, "POLITE_TO_ALL"sv}}};
inline constexpr std::array<Option, 5> emergency_systems{{{0x00, "NONE"sv},
                                                          {0x01, "A1"sv},
                                                          {0x02, "A2"sv},
                                                          {0x03, "A3"sv},
                                                          {0x04, "A4"sv}}};
inline constexpr std::array<Option, 4> tx_tone_types{{{0x00, "OFF"sv},
                                                      {0x04, "CTCSS"sv},
                                                      {0x08, "DCS"sv},
                                                      {0x0C, "DCS_INVERT"sv}}};
inline constexpr std::array<Option, 4> rx_tone_types{{{0x00, "OFF"sv},
                                                      {0x01, "CTCSS"sv},
                                                      {0x02, "DCS"sv},
                                                      {0x03, "DCS_INVERT"sv}}};
inline constexpr std::array<Option, 3> scan_tx_modes{
    {{0x00, "CURRENT_CHANNEL"sv},
     {0x04, "LAST_OPERATED"sv},
     {0x08, "DESIGNATED"sv}}};
inline constexpr std::array<Option, 7> call_types{{{0x04, "GROUP"sv},
                                                   {0x05, "PRIVATE"sv},
                                                   {0x06, "ALL_CALL"sv},
                                                   {0x07, "NO_ADDRESS"sv},
                                                   {0x08, "RAW_DATA"sv},
                                                   {0x09, "DEFINED_DATA"sv},
                                                   {0x0A, "SP_DATA"sv}}};
inline constexpr std::array<Option, 2> aprs_call_types{
    {{0x00, "PRIVATE"sv}, {0x04, "GROUP"sv}}};
inline constexpr std::array<Option, 3> aprs_report_slots{
    {{0x00, "CURRENT"sv}, {0x01, "TS1"sv}, {0x02, "TS2"sv}}};
inline constexpr std::array<Option, 2> beacon_sources{
    {{0x00, "FIXED_LOCATION"sv}, {0x01, "GPS_LOCATION"sv}}};
inline constexpr std::array<Option, 2> latitude_hemispheres{
    {{0x00, "NORTH"sv}, {0x01, "SOUTH"sv}}};
inline constexpr std::array<Option, 2> longitude_hemispheres{
    {{0x00, "EAST"sv}, {0x01, "WEST"sv}}};
inline constexpr std::array<Option, 2> ax25_powers{
    {{0x00, "LOW"sv}, {0x01, "HIGH"sv}}};

// Record layouts, offsets are relative to the slot

inline constexpr std::array<FieldSpec, 8> info_fields{{
    {"factory_number"sv, FixedText{.offset = 0x00, .length = 16}},
    {"serial_number"sv, FixedText{.offset = 0x10, .length = 16}},
    {"model"sv, FixedText{.offset = 0x20, .length = 16}},
    {"firmware_version"sv, FixedText{.offset = 0x30, .length = 16}},
    {"cps_version"sv, FixedText{.offset = 0x40, .length = 16}},
    {"frequency_range"sv, FixedText{.offset = 0x50, .length = 16}},
    {"update_date"sv, FixedText{.offset = 0x60, .length = 16}},
    {"firmware_id"sv, FixedText{.offset = 0x70, .length = 16}},
}};

// 0x0080: basic parameters, prompt tones, indicators, menu and keys
inline constexpr std::array<FieldSpec, 106> settings_fields{{
    {"radio_name"sv, FixedText{.offset = 0x00, .length = 10}},
    {"dmr_id"sv, ScaledInt{.offset = 0x10, .width = 3}},
    {"squelch_a"sv, ScaledInt{.offset = 0x13, .mask = 0x0F, .max_raw = 9}},
    {"squelch_b"sv,
     ScaledInt{.offset = 0x13, .mask = 0xF0, .max_raw = 9}},
    {"language"sv,
     Choice{.offset = 0x15, .mask = 0x10, .options = languages}},
    {"boot_ringtone"sv, BitFlag{.offset = 0x15, .mask = 0x02}},
    {"backlight"sv,
     Choice{.offset = 0x15, .mask = 0x28, .options = backlight_modes}},
    {"keylock"sv, Choice{.offset = 0x15, .mask = 0x44, .options = keylock_modes}},
    {"mic_gain_1"sv, BitFlag{.offset = 0x24, .mask = 0x80}},
    {"mic_gain_1_level"sv,
     ScaledInt{.offset = 0x24, .mask = 0x07, .scale = 4, .max_raw = 4}},
    {"mic_gain_2"sv, BitFlag{.offset = 0x25, .mask = 0x80}},
    {"mic_gain_2_level"sv,
     ScaledInt{.offset = 0x25, .mask = 0x1F, .max_raw = 20}},
    {"busy_channel_lockout"sv, BitFlag{.offset = 0x26, .mask = 0x80}},
    {"vox"sv, BitFlag{.offset = 0x26, .mask = 0x40}},
    {"vox_sensitivity"sv,
     ScaledInt{.offset = 0x26, .mask = 0x0F, .bias = 1, .max_raw = 9}},
    {"tone_profile"sv,
     Choice{.offset = 0x27, .mask = 0x01, .options = tone_profiles}},
    {"sms_prompt"sv, ScaledInt{.offset = 0x28, .mask = 0x0F}},
    {"private_call_tone"sv, ScaledInt{.offset = 0x29, .mask = 0x05}},
    {"group_call_tone"sv, ScaledInt{.offset = 0x2A, .mask = 0x05}},
    {"key_tone"sv, BitFlag{.offset = 0x2B, .mask = 0x80}},
    {"key_tone_volume"sv,
     ScaledInt{.offset = 0x2B, .mask = 0x0F, .max_raw = 15}},
    {"low_battery_tone"sv, BitFlag{.offset = 0x2C, .mask = 0x80}},
    {"low_battery_volume"sv,
     ScaledInt{.offset = 0x2C, .mask = 0x0F, .max_raw = 15}},
    {"led_all"sv, BitFlag{.offset = 0x2D, .mask = 0x10}},
    {"led_tx"sv, BitFlag{.offset = 0x2D, .mask = 0x08}},
    {"led_rx"sv, BitFlag{.offset = 0x2D, .mask = 0x04}},
    {"led_scan"sv, BitFlag{.offset = 0x2D, .mask = 0x02}},
    {"led_low_battery"sv, BitFlag{.offset = 0x2D, .mask = 0x01}},
    // menu entries shown on the radio
    {"menu_contact_list"sv, BitFlag{.offset = 0x2E, .mask = 0x01}},
    {"menu_new_contact"sv, BitFlag{.offset = 0x2E, .mask = 0x02}},
    {"menu_manual_dial"sv, BitFlag{.offset = 0x2E, .mask = 0x04}},
    {"menu_ham_contacts"sv, BitFlag{.offset = 0x2E, .mask = 0x08}},
    {"menu_ham_groups"sv, BitFlag{.offset = 0x2E, .mask = 0x10}},
    {"menu_sms_write"sv, BitFlag{.offset = 0x2F, .mask = 0x01}},
    {"menu_sms_quick"sv, BitFlag{.offset = 0x2F, .mask = 0x02}},
    {"menu_sms_inbox"sv, BitFlag{.offset = 0x2F, .mask = 0x04}},
    {"menu_sms_outbox"sv, BitFlag{.offset = 0x2F, .mask = 0x08}},
    {"menu_sms_drafts"sv, BitFlag{.offset = 0x2F, .mask = 0x10}},
    {"menu_call_log_outgoing"sv, BitFlag{.offset = 0x30, .mask = 0x01}},
    {"menu_call_log_received"sv, BitFlag{.offset = 0x30, .mask = 0x02}},
    {"menu_call_log_missed"sv, BitFlag{.offset = 0x30, .mask = 0x04}},
    {"menu_scan"sv, BitFlag{.offset = 0x31, .mask = 0x01}},
    {"menu_scan_list"sv, BitFlag{.offset = 0x31, .mask = 0x02}},
    {"menu_scan_mode"sv, BitFlag{.offset = 0x31, .mask = 0x04}},
    {"menu_roam"sv, BitFlag{.offset = 0x31, .mask = 0x08}},
    {"menu_zone_list"sv, BitFlag{.offset = 0x32, .mask = 0x01}},
    {"menu_language"sv, BitFlag{.offset = 0x33, .mask = 0x01}},
    {"menu_keylock"sv, BitFlag{.offset = 0x33, .mask = 0x02}},
    {"menu_backlight"sv, BitFlag{.offset = 0x33, .mask = 0x04}},
    {"menu_leds"sv, BitFlag{.offset = 0x33, .mask = 0x08}},
    {"menu_display_mode"sv, BitFlag{.offset = 0x33, .mask = 0x10}},
    {"menu_vox"sv, BitFlag{.offset = 0x33, .mask = 0x20}},
    {"menu_channel_switch"sv, BitFlag{.offset = 0x33, .mask = 0x40}},
    {"menu_factory_reset"sv, BitFlag{.offset = 0x33, .mask = 0x80}},
    {"menu_timeout_timer"sv, BitFlag{.offset = 0x35, .mask = 0x01}},
    {"menu_power"sv, BitFlag{.offset = 0x35, .mask = 0x02}},
    {"menu_repeater"sv, BitFlag{.offset = 0x35, .mask = 0x04}},
    {"menu_sleep_mode"sv, BitFlag{.offset = 0x35, .mask = 0x08}},
    {"menu_squelch"sv, BitFlag{.offset = 0x35, .mask = 0x10}},
    {"menu_bandwidth"sv, BitFlag{.offset = 0x35, .mask = 0x20}},
    {"menu_busy_channel_lockout"sv, BitFlag{.offset = 0x35, .mask = 0x40}},
    {"menu_signalling"sv, BitFlag{.offset = 0x35, .mask = 0x80}},
    {"menu_tone_profile"sv, BitFlag{.offset = 0x36, .mask = 0x01}},
    {"menu_key_tone"sv, BitFlag{.offset = 0x36, .mask = 0x02}},
    {"menu_power_tone"sv, BitFlag{.offset = 0x36, .mask = 0x04}},
    {"menu_message_tone"sv, BitFlag{.offset = 0x36, .mask = 0x08}},
    {"menu_private_call_tone"sv, BitFlag{.offset = 0x36, .mask = 0x10}},
    {"menu_group_call_tone"sv, BitFlag{.offset = 0x36, .mask = 0x20}},
    {"menu_call_tone"sv, BitFlag{.offset = 0x36, .mask = 0x40}},
    {"menu_power_on_tone"sv, BitFlag{.offset = 0x36, .mask = 0x80}},
    {"menu_gps"sv, BitFlag{.offset = 0x37, .mask = 0x01}},
    {"menu_torch"sv, BitFlag{.offset = 0x37, .mask = 0x02}},
    {"menu_fm_radio"sv, BitFlag{.offset = 0x37, .mask = 0x04}},
    {"menu_time"sv, BitFlag{.offset = 0x37, .mask = 0x08}},
    {"menu_dtmf"sv, BitFlag{.offset = 0x37, .mask = 0x10}},
    {"menu_speaker_handmic"sv, BitFlag{.offset = 0x37, .mask = 0x20}},
    {"menu_aprs"sv, BitFlag{.offset = 0x37, .mask = 0x40}},
    {"menu_record_set"sv, BitFlag{.offset = 0x38, .mask = 0x01}},
    {"menu_record_list"sv, BitFlag{.offset = 0x38, .mask = 0x02}},
    {"menu_record_clear"sv, BitFlag{.offset = 0x38, .mask = 0x04}},
    {"menu_record_space"sv, BitFlag{.offset = 0x38, .mask = 0x08}},
    {"menu_radio_id"sv, BitFlag{.offset = 0x39, .mask = 0x01}},
    {"menu_rx_group_list"sv, BitFlag{.offset = 0x39, .mask = 0x02}},
    {"menu_channel_contact"sv, BitFlag{.offset = 0x39, .mask = 0x04}},
    {"menu_version"sv, BitFlag{.offset = 0x39, .mask = 0x08}},
    {"menu_radio_check"sv, BitFlag{.offset = 0x3A, .mask = 0x01}},
    {"menu_call_alert"sv, BitFlag{.offset = 0x3A, .mask = 0x02}},
    {"menu_radio_monitor"sv, BitFlag{.offset = 0x3A, .mask = 0x04}},
    {"menu_radio_disable"sv, BitFlag{.offset = 0x3A, .mask = 0x08}},
    {"menu_radio_enable"sv, BitFlag{.offset = 0x3A, .mask = 0x10}},
    {"menu_vfo"sv, BitFlag{.offset = 0x3B, .mask = 0x01}},
    {"menu_local_repeat"sv, BitFlag{.offset = 0x3C, .mask = 0x01}},
    {"menu_end_tone"sv, BitFlag{.offset = 0x3D, .mask = 0x01}},
    // programmable keys
    {"long_press_duration"sv,
     Choice{.offset = 0x41, .mask = 0xFF, .options = long_press_durations}},
    {"p1_long"sv, Choice{.offset = 0x42, .mask = 0xFF, .options = button_functions}},
    {"p1_short"sv, Choice{.offset = 0x43, .mask = 0xFF, .options = button_functions}},
    {"p2_long"sv, Choice{.offset = 0x44, .mask = 0xFF, .options = button_functions}},
    {"p2_short"sv, Choice{.offset = 0x45, .mask = 0xFF, .options = button_functions}},
    {"p3_long"sv, Choice{.offset = 0x46, .mask = 0xFF, .options = button_functions}},
    {"p3_short"sv, Choice{.offset = 0x47, .mask = 0xFF, .options = button_functions}},
    {"p4_long"sv, Choice{.offset = 0x48, .mask = 0xFF, .options = button_functions}},
    {"p4_short"sv, Choice{.offset = 0x49, .mask = 0xFF, .options = button_functions}},
    {"p5_long"sv, Choice{.offset = 0x4A, .mask = 0xFF, .options = button_functions}},
    {"p5_short"sv, Choice{.offset = 0x4B, .mask = 0xFF, .options = button_functions}},
    {"p6_long"sv, Choice{.offset = 0x4C, .mask = 0xFF, .options = button_functions}},
    {"p6_short"sv, Choice{.offset = 0x4D, .mask = 0xFF, .options = button_functions}},
}};

inline constexpr std::array<FieldSpec, 1> message_fields{{
    {"text"sv, FixedText{.offset = 0x00, .length = message_size}},
}};

inline constexpr std::array<FieldSpec, 6> aprs_channel_fields{{
    {"zone"sv, SlotRef{.offset = 0x00, .width = 2, .target = "zones"sv}},
    {"channel"sv, SlotRef{.offset = 0x02, .width = 2, .target = "channels"sv}},
    {"talkgroup"sv, ScaledInt{.offset = 0x04, .width = 3}},
    {"report_slot"sv,
     Choice{.offset = 0x07, .mask = 0x03, .options = aprs_report_slots}},
    {"call_type"sv,
     Choice{.offset = 0x07, .mask = 0x04, .options = aprs_call_types}},
    {"ptt"sv, BitFlag{.offset = 0x07, .mask = 0x08}},
}};

// 0x0E8B: analog APRS beacon and AX.25 parameters
inline constexpr std::array<FieldSpec, 21> aprs_fields{{
    {"manual_tx_interval"sv, ScaledInt{.offset = 0x00}},
    {"auto_tx_interval_s"sv, ScaledInt{.offset = 0x01, .scale = 30}},
    {"beacon"sv, Choice{.offset = 0x03, .mask = 0x01, .options = beacon_sources}},
    {"latitude_hemisphere"sv,
     Choice{.offset = 0x04, .mask = 0x01, .options = latitude_hemispheres}},
    {"longitude_hemisphere"sv,
     Choice{.offset = 0x05, .mask = 0x01, .options = longitude_hemispheres}},
    // degrees, minutes and seconds as decimal digits DDMMSSS
    {"latitude"sv, ScaledInt{.offset = 0x06, .width = 4}},
    {"longitude"sv, ScaledInt{.offset = 0x0A, .width = 4}},
    {"ax25_tx_freq"sv, ScaledInt{.offset = 0x0E, .width = 4}},
    // 0 off, 1..51 CTCSS, 53..158 DCS normal, 160..267 DCS inverted
    {"ax25_tone_code"sv, ScaledInt{.offset = 0x12, .width = 2}},
    {"ax25_tx_delay_ms"sv, ScaledInt{.offset = 0x14, .scale = 20}},
    {"ax25_prewave_ms"sv, ScaledInt{.offset = 0x15, .scale = 10}},
    {"ax25_tx_power"sv,
     Choice{.offset = 0x16, .mask = 0x01, .options = ax25_powers}},
    {"ax25_aprs_tone"sv, BitFlag{.offset = 0x17, .mask = 0x01}},
    {"ax25_dest_ssid"sv, ScaledInt{.offset = 0x18}},
    {"ax25_own_ssid"sv, ScaledInt{.offset = 0x19}},
    {"ax25_dest_callsign"sv, FixedText{.offset = 0x1A, .length = 6}},
    {"ax25_own_callsign"sv, FixedText{.offset = 0x20, .length = 6}},
    {"symbol_table"sv, ScaledInt{.offset = 0x26}},
    {"map_icon"sv, ScaledInt{.offset = 0x27}},
    {"signal_path"sv, FixedText{.offset = 0x28, .length = 20}},
    {"sending_text"sv, FixedText{.offset = 0x3C, .length = 61}},
}};

// 0x0FAC: remote DMR service decoding
inline constexpr std::array<FieldSpec, 6> dmr_service_fields{{
    {"remote_monitor_duration_s"sv,
     ScaledInt{.offset = 0x00, .scale = 10, .bias = 10}},
    {"remote_monitor_decode"sv, BitFlag{.offset = 0x01, .mask = 0x80}},
    {"remote_kill_decode"sv, BitFlag{.offset = 0x01, .mask = 0x40}},
    {"radio_detection_decode"sv, BitFlag{.offset = 0x01, .mask = 0x20}},
    {"radio_revive_decode"sv, BitFlag{.offset = 0x01, .mask = 0x10}},
    {"call_alert_decode"sv, BitFlag{.offset = 0x01, .mask = 0x08}},
}};

// 0x12D8: timers, roaming, GPS, DTMF and the table counts
inline constexpr std::array<FieldSpec, 28> dmr_settings_fields{{
    {"call_hang_up_tone"sv,
     Choice{.offset = 0x00, .mask = 0x01, .options = hang_up_tones}},
    {"timeout_timer"sv, ScaledInt{.offset = 0x77}},
    {"group_call_hang_ms"sv,
     ScaledInt{.offset = 0x78, .mask = 0x0F, .scale = 500}},
    {"private_call_hang_ms"sv,
     ScaledInt{.offset = 0x79, .mask = 0x0F, .scale = 500}},
    // 10 s steps up to 6, then minutes
    {"gps_interval"sv, ScaledInt{.offset = 0x7B}},
    // zone and channel ids, 0xFFFF for both selects the current channel
    {"gps_zone_id"sv, ScaledInt{.offset = 0x7C, .width = 2}},
    {"gps_channel_id"sv, ScaledInt{.offset = 0x7E, .width = 2}},
    {"dtmf"sv, BitFlag{.offset = 0x8B, .mask = 0x01}},
    {"import_delay_ms"sv, ScaledInt{.offset = 0x98, .scale = 10}},
    {"dtmf_on_time_ms"sv, ScaledInt{.offset = 0x99, .scale = 10}},
    {"dtmf_off_time_ms"sv, ScaledInt{.offset = 0x9A, .scale = 10}},
    {"dtmf_volume"sv,
     ScaledInt{.offset = 0x9B, .mask = 0x0F, .max_raw = 12}},
    {"roaming_mode"sv,
     Choice{.offset = 0x9D, .mask = 0x03, .options = roaming_modes}},
    {"rssi_threshold_dbm"sv,
     ScaledInt{.offset = 0x9E, .scale = -1, .bias = -90}},
    {"connect_check_timer"sv, ScaledInt{.offset = 0x9F}},
    {"repeater_check_timer"sv, ScaledInt{.offset = 0xA0}},
    {"connect_timer"sv,
     ScaledInt{.offset = 0xA1, .mask = 0x0F, .bias = 1, .max_raw = 9}},
    {"gps"sv, BitFlag{.offset = 0xA2, .mask = 0x01}},
    {"roaming"sv, BitFlag{.offset = 0xA3, .mask = 0x01}},
    {"scan_mode"sv, Choice{.offset = 0xA5, .mask = 0x03, .options = scan_modes}},
    {"record"sv, Choice{.offset = 0xA8, .mask = 0x03, .options = record_modes}},
    {"end_tone"sv, Choice{.offset = 0xA9, .mask = 0x03, .options = end_tones}},
    {"restart_prompt"sv, ScaledInt{.offset = 0xAB, .mask = 0x0F}},
    {"p7_long"sv, Choice{.offset = 0xAD, .mask = 0xFF, .options = button_functions}},
    {"p7_short"sv, Choice{.offset = 0xAE, .mask = 0xFF, .options = button_functions}},
    {"zone_count"sv,
     ScaledInt{.offset = 0xB7, .width = 2, .max_raw = zone_capacity}},
    {"channel_count"sv,
     ScaledInt{.offset = 0xB9, .width = 2, .max_raw = channel_capacity}},
    {"contact_count"sv,
     ScaledInt{.offset = 0xBB, .width = 2, .max_raw = contact_capacity}},
}};

// first_channel counts 32 byte records from the start of the zone table,
// which the channel table follows directly
inline constexpr std::array<FieldSpec, 4> zone_fields{{
    {"id"sv, ScaledInt{.offset = 0x00, .width = 2}},
    {"name"sv, FixedText{.offset = 0x03, .length = 10}},
    {"first_channel"sv, SlotRef{.offset = 0x0D,
                                .width = 2,
                                .target = "channels"sv,
                                .base = zone_capacity}},
    {"channel_count"sv,
     ScaledInt{.offset = 0x0F, .width = 2, .max_raw = channel_capacity}},
}};

inline constexpr std::array<FieldSpec, 27> channel_fields{{
    {"id"sv, ScaledInt{.offset = 0x00, .width = 2}},
    {"name"sv, FixedText{.offset = 0x02, .length = 10}},
    {"rx_freq_hz"sv, ScaledInt{.offset = 0x0C, .width = 4, .scale = 10}},
    {"tx_freq_hz"sv, ScaledInt{.offset = 0x10, .width = 4, .scale = 10}},
    {"mode"sv, Choice{.offset = 0x14, .mask = 0xC0, .options = channel_modes}},
    {"power"sv, Choice{.offset = 0x14, .mask = 0x20, .options = tx_powers}},
    {"bandwidth"sv, Choice{.offset = 0x14, .mask = 0x10, .options = bandwidths}},
    {"alarm"sv, BitFlag{.offset = 0x14, .mask = 0x08}},
    {"pct"sv, Choice{.offset = 0x14, .mask = 0x02, .options = pct_modes}},
    {"rx_timeslot"sv,
     Choice{.offset = 0x14, .mask = 0x01, .options = rx_timeslots}},
    {"rx_color_code"sv,
     ScaledInt{.offset = 0x15, .mask = 0x0F, .max_raw = 15}},
    {"confirmed_data"sv, BitFlag{.offset = 0x15, .mask = 0x10}},
    {"tx_policy"sv, Choice{.offset = 0x15, .mask = 0xC0, .options = tx_policies}},
    {"rx_group"sv, SlotRef{.offset = 0x17, .width = 1, .target = "rx_groups"sv}},
    {"scan_list"sv,
     SlotRef{.offset = 0x18, .width = 1, .target = "scan_lists"sv}},
    {"rx_only"sv, BitFlag{.offset = 0x19, .mask = 0x10}},
    {"emergency_system"sv,
     Choice{.offset = 0x19, .mask = 0x0F, .options = emergency_systems}},
    {"tx_tone_type"sv,
     Choice{.offset = 0x1A, .mask = 0x0C, .options = tx_tone_types}},
    {"rx_tone_type"sv,
     Choice{.offset = 0x1A, .mask = 0x03, .options = rx_tone_types}},
    {"rx_tone"sv,
     ToneCode{.offset = 0x1B, .type_offset = 0x1A, .type_mask = 0x03}},
    {"tx_tone"sv,
     ToneCode{.offset = 0x1C, .type_offset = 0x1A, .type_mask = 0x0C}},
    {"rx_timeslot_auto"sv,
     BitFlag{.offset = 0x1D, .mask = 0x01, .inverted = true}},
    {"tx_timeslot"sv,
     Choice{.offset = 0x1D, .mask = 0x02, .options = tx_timeslots}},
    {"tx_timeslot_auto"sv,
     BitFlag{.offset = 0x1D, .mask = 0x04, .inverted = true}},
    {"tx_color_code"sv,
     ScaledInt{.offset = 0x1D, .mask = 0xF0, .max_raw = 15}},
    {"default_contact"sv,
     SlotRef{.offset = 0x1E, .width = 1, .target = "contacts"sv}},
    {"aprs_report"sv, ScaledInt{.offset = 0x1F, .mask = 0xF0, .max_raw = 8}},
}};

inline constexpr std::array<FieldSpec, 7> scan_list_fields{{
    {"name"sv, FixedText{.offset = 0x00, .length = 10}},
    {"talkback"sv, BitFlag{.offset = 0x0B, .mask = 0x20}},
    {"tx_mode"sv, Choice{.offset = 0x0B, .mask = 0x0C, .options = scan_tx_modes}},
    {"designated_zone"sv,
     SlotRef{.offset = 0x0C, .width = 2, .target = "zones"sv}},
    {"designated_channel"sv,
     SlotRef{.offset = 0x0E, .width = 2, .target = "channels"sv}},
    {"member_zones"sv, SlotRef{.offset = 0x10,
                               .width = 2,
                               .target = "zones"sv,
                               .count = 50,
                               .stride = 4}},
    {"member_channels"sv, SlotRef{.offset = 0x12,
                                  .width = 2,
                                  .target = "channels"sv,
                                  .count = 50,
                                  .stride = 4}},
}};

inline constexpr std::array<FieldSpec, 2> rx_group_fields{{
    {"name"sv, FixedText{.offset = 0x00, .length = 10}},
    {"contacts"sv, SlotRef{.offset = 0x0A,
                           .width = 2,
                           .target = "contacts"sv,
                           .count = 100}},
}};

inline constexpr std::array<FieldSpec, 4> contact_fields{{
    {"id"sv, ScaledInt{.offset = 0x00, .width = 2}},
    {"call_type"sv, Choice{.offset = 0x02, .mask = 0xFF, .options = call_types}},
    {"name"sv, FixedText{.offset = 0x03, .length = 10}},
    {"dmr_id"sv, ScaledInt{.offset = 0x0D, .width = 3}},
}};

inline constexpr RegionDescriptor info_region{
    "info"sv, 0x00000, 0x80, 0x80, info_fields};
inline constexpr RegionDescriptor settings_region{
    "settings"sv, 0x00080, 0xAB, 0xAB, settings_fields};
// quick messages 16 to 99, the 100th would overlap the APRS channels
inline constexpr RegionDescriptor messages_ext_region{
    "messages_ext"sv, 0x0012B, 84 * message_size, message_size,
    message_fields};
inline constexpr RegionDescriptor aprs_channels_region{
    "aprs_channels"sv, 0x00E4B, 8 * 8, 8, aprs_channel_fields};
inline constexpr RegionDescriptor aprs_region{
    "aprs"sv, 0x00E8B, 0x79, 0x79, aprs_fields};
inline constexpr RegionDescriptor reserved_a_region{
    "reserved_a"sv, 0x00F04, 0xA8, 0xA8};
inline constexpr RegionDescriptor dmr_service_region{
    "dmr_service"sv, 0x00FAC, 2, 2, dmr_service_fields};
// quick messages 1 to 15
inline constexpr RegionDescriptor messages_region{
    "messages"sv, 0x00FAE, 15 * message_size, message_size, message_fields};
inline constexpr RegionDescriptor reserved_b_region{
    "reserved_b"sv, 0x01206, 0xD2, 0xD2};
inline constexpr RegionDescriptor dmr_settings_region{
    "dmr_settings"sv, 0x012D8, 0xF7, 0xF7, dmr_settings_fields};
inline constexpr RegionDescriptor scan_lists_region{
    "scan_lists"sv, 0x013CF, scan_list_capacity * 216, 216, scan_list_fields};
inline constexpr RegionDescriptor rx_groups_region{
    "rx_groups"sv, 0x0E6BF, rx_group_capacity * 210, 210, rx_group_fields};
inline constexpr RegionDescriptor reserved_c_region{
    "reserved_c"sv, 0x1B3D3, 0x2D, 0x2D};
inline constexpr RegionDescriptor contacts_region{
    "contacts"sv, 0x1B400, contact_capacity * 16, 16, contact_fields};
// pads the contact table to an odd number of KiB
inline constexpr RegionDescriptor reserved_d_region{
    "reserved_d"sv, 0x1F400, 0x400, 0x400};
inline constexpr RegionDescriptor zones_region{
    "zones"sv, 0x1F800, zone_capacity * 32, 32, zone_fields};
inline constexpr RegionDescriptor channels_region{
    "channels"sv, 0x20000, channel_capacity * 32, 32, channel_fields};

inline constexpr std::array<RegionDescriptor, 17> codeplug_regions{
    info_region,         settings_region,    messages_ext_region,
    aprs_channels_region, aprs_region,       reserved_a_region,
    dmr_service_region,  messages_region,    reserved_b_region,
    dmr_settings_region, scan_lists_region,  rx_groups_region,
    reserved_c_region,   contacts_region,    reserved_d_region,
    zones_region,        channels_region};

static_assert(Layout::in_order(codeplug_regions),
              "Region map must be in order of increasing memory addresses");
static_assert(codeplug_regions.back().end() == codeplug_size,
              "Codeplug regions must end at the codeplug size");
static_assert(zones_region.end() == channels_region.start,
              "Channels must directly follow the zones");

// Bulk table header fields
inline constexpr std::array<FieldSpec, 2> bulk_header_fields{{
    {"count"sv, ScaledInt{.offset = 0x00, .width = 4}},
    {"record_size"sv, ScaledInt{.offset = 0x04, .width = 1}},
}};

Layout::MemoryMap codeplug_map();

// record_size is 16 or 128
Layout::MemoryMap contact_db_map(std::uint32_t record_size = 16);

Layout::MemoryMap group_db_map();

} // namespace rt73map
