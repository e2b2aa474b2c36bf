#pragma once
#include <cstdint>
#include <string_view>

#include "src/error.hh"

namespace encspec::constants {
	constexpr std::string_view DEFAULT_EXTENSION = "mkv";
	constexpr uint32_t DEFAULT_AUDIO_KBPS_PER_CHANNEL = 96;

	constexpr int16_t X264_DEFAULT_CRF  = 18;
	constexpr int16_t X265_DEFAULT_CRF  = 18;
	constexpr int16_t AOM_DEFAULT_CRF   = 16;
	constexpr uint8_t AOM_DEFAULT_SPEED = 4;
	constexpr int16_t SVT_DEFAULT_CRF   = 16;
	constexpr uint8_t SVT_DEFAULT_SPEED = 4;
	constexpr int16_t RAV1E_DEFAULT_CRF   = 40;
	constexpr uint8_t RAV1E_DEFAULT_SPEED = 5;

	constexpr ValueRange X264_QUANTIZER_RANGE  = {-12, 51};
	constexpr ValueRange X265_QUANTIZER_RANGE  = {0, 51};
	constexpr ValueRange AOM_QUANTIZER_RANGE   = {0, 63};
	constexpr ValueRange SVT_QUANTIZER_RANGE   = {0, 63};
	constexpr ValueRange RAV1E_QUANTIZER_RANGE = {0, 255};

	constexpr ValueRange SPEED_RANGE = {0, 10};
	constexpr ValueRange GRAIN_RANGE = {0, 64};
	constexpr ValueRange AUDIO_BITRATE_RANGE = {1, UINT32_MAX};

	// Smallest accepted output width/height; both must also be even.
	constexpr uint32_t MIN_RESOLUTION = 64;
	constexpr ValueRange RESOLUTION_RANGE = {MIN_RESOLUTION, UINT32_MAX};
}
