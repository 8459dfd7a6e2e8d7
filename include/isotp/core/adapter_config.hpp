#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "separation_time.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace isotp {

    // ─── Protocol adapter configuration ─────────────────────────────────────────
    struct AdapterConfig {
        FrameMode mode = FrameMode::Classic;
        bool padding_enabled = true;
        u8 block_size = 0;      // advertised to the peer; 0 = unlimited
        u8 separation_time = 0; // advertised STmin (raw encoding)
        u8 data_padding_byte = DEFAULT_DATA_PADDING_BYTE;
        u8 fc_padding_byte = DEFAULT_FC_PADDING_BYTE;

        // Fluent API
        AdapterConfig &set_mode(FrameMode m) {
            mode = m;
            return *this;
        }
        AdapterConfig &set_padding(bool enabled) {
            padding_enabled = enabled;
            return *this;
        }
        AdapterConfig &set_block_size(u8 bs) {
            block_size = bs;
            return *this;
        }
        AdapterConfig &set_separation_time(u8 st) {
            separation_time = st;
            return *this;
        }
        AdapterConfig &set_data_padding_byte(u8 b) {
            data_padding_byte = b;
            return *this;
        }
        AdapterConfig &set_flow_control_padding_byte(u8 b) {
            fc_padding_byte = b;
            return *this;
        }

        static AdapterConfig classic() { return AdapterConfig{}; }
        static AdapterConfig extended() { return AdapterConfig{}.set_mode(FrameMode::Extended); }

        u8 frame_capacity() const noexcept { return isotp::frame_capacity(mode); }
        u8 single_frame_max() const noexcept { return single_frame_max_data(mode); }
    };

    // ─── Validation result ──────────────────────────────────────────────────────
    struct AdapterConfigValidation {
        bool mode_ok = false;
        bool separation_time_ok = false;
        bool padding_bytes_ok = false;
        bool overall_ok = false;
        dp::String error_message;
    };

    inline AdapterConfigValidation validate_adapter_config(const AdapterConfig &config) {
        AdapterConfigValidation result;
        result.mode_ok = (config.mode == FrameMode::Classic || config.mode == FrameMode::Extended);
        result.separation_time_ok = is_valid_separation_time(config.separation_time);
        result.padding_bytes_ok = (config.data_padding_byte != config.fc_padding_byte);
        result.overall_ok = result.mode_ok && result.separation_time_ok && result.padding_bytes_ok;

        if (!result.mode_ok) {
            result.error_message = "frame mode must be classic or extended";
        } else if (!result.separation_time_ok) {
            result.error_message = "reserved STmin value: " + dp::String(std::to_string(config.separation_time));
        } else if (!result.padding_bytes_ok) {
            result.error_message = "data and flow control padding bytes must differ";
        }

        if (!result.overall_ok) {
            echo::category("isotp.config").warn("adapter config rejected: ", result.error_message);
        }
        return result;
    }

    inline Result<void> enforce_adapter_config(const AdapterConfig &config) {
        auto validation = validate_adapter_config(config);
        if (!validation.overall_ok) {
            return Result<void>::err(Error::invalid_argument(validation.error_message));
        }
        return {};
    }

} // namespace isotp
