#include "src/filter/token.hh"

#include <cstdlib>
#include <format>
#include <memory>
#include <sstream>
#include <variant>

namespace encspec {
	static std::string track_to_clause(const config::TrackSpec& track) {
		std::string s = std::visit(Overloaded {
			[](const config::FromVideo& v) {return std::to_string(v.index);},
			[](const config::External& e)  {return e.path.string();},
		}, track.source);

		if(track.enabled || track.forced) {
			s += '-';
		}
		if(track.enabled) {
			s += 'e';
		}
		if(track.forced) {
			s += 'f';
		}

		return s;
	}

	static std::string track_list_to_clause(std::span<const config::TrackSpec> tracks) {
		std::stringstream s;

		for(size_t i = 0; i < tracks.size(); i++) {
			if(i != 0) {
				s << '|';
			}
			s << track_to_clause(tracks[i]);
		}

		return std::move(s).str();
	}

	std::string_view FilterToken::filter_name() const {
		switch(m_type) {
			case Type::VideoEncoderName:
				return "enc";
			case Type::Quantizer:
				return "q";
			case Type::Speed:
				return "s";
			case Type::Profile:
				return "p";
			case Type::Grain:
				return "g";
			case Type::Compat:
				return "compat";
			case Type::Extension:
				return "ext";
			case Type::BitDepth:
				return "bd";
			case Type::Resolution:
				return "res";
			case Type::AudioEncoderName:
				return "aenc";
			case Type::AudioBitrate:
				return "ab";
			case Type::AudioTrackList:
				return "at";
			case Type::AudioNormalize:
				return "an";
			case Type::SubtitleTrackList:
				return "st";
		}

		std::abort(); // unreachable
	}

	std::string FilterToken::to_string() const {
		const std::string_view key = filter_name();

		switch(m_type) {
			case Type::VideoEncoderName:
			case Type::Extension:
			case Type::AudioEncoderName:
				return std::format("{}={}", key, m_name);
			case Type::Quantizer:
				return std::format("{}={}", key, m_quantizer);
			case Type::Speed:
			case Type::Grain:
			case Type::BitDepth:
				return std::format("{}={}", key, m_small);
			case Type::Profile:
				return std::format("{}={}", key, config::Profile_to_str(m_profile));
			case Type::Compat:
				return std::format("{}={}", key, m_compat ? 1 : 0);
			case Type::Resolution:
				return std::format("{}={}x{}", key, m_resolution.width, m_resolution.height);
			case Type::AudioBitrate:
				return std::format("{}={}", key, m_bitrate);
			case Type::AudioTrackList:
			case Type::SubtitleTrackList:
				return std::format("{}={}", key, track_list_to_clause(m_tracks));
			case Type::AudioNormalize:
				return "an=1";
		}

		std::abort(); // unreachable
	}

	FilterToken FilterToken::video_encoder(std::string_view name) {
		FilterToken t;
		t.m_type = Type::VideoEncoderName;
		t.m_name = name;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::quantizer(int16_t q) {
		FilterToken t;
		t.m_type = Type::Quantizer;
		t.m_quantizer = q;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::speed(uint8_t speed) {
		FilterToken t;
		t.m_type = Type::Speed;
		t.m_small = speed;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::profile(config::Profile profile) {
		FilterToken t;
		t.m_type = Type::Profile;
		t.m_profile = profile;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::grain(uint8_t grain) {
		FilterToken t;
		t.m_type = Type::Grain;
		t.m_small = grain;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::compat(bool compat) {
		FilterToken t;
		t.m_type = Type::Compat;
		t.m_compat = compat;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::extension(std::string_view extension) {
		FilterToken t;
		t.m_type = Type::Extension;
		t.m_name = extension;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::bit_depth(uint8_t depth) {
		FilterToken t;
		t.m_type = Type::BitDepth;
		t.m_small = depth;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::resolution(config::Resolution resolution) {
		FilterToken t;
		t.m_type = Type::Resolution;
		t.m_resolution = resolution;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::audio_encoder(std::string_view name) {
		FilterToken t;
		t.m_type = Type::AudioEncoderName;
		t.m_name = name;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::audio_bitrate(uint32_t kbps) {
		FilterToken t;
		t.m_type = Type::AudioBitrate;
		t.m_bitrate = kbps;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::track_list(Type type, std::vector<config::TrackSpec>&& tracks) {
		FilterToken t;
		t.m_type = type;
		std::construct_at(&t.m_tracks, std::move(tracks));

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::audio_tracks(std::vector<config::TrackSpec>&& tracks) {
		return track_list(Type::AudioTrackList, std::move(tracks));
	}

	FilterToken FilterToken::audio_normalize() {
		FilterToken t;
		t.m_type = Type::AudioNormalize;

		return FilterToken(std::move(t));
	}

	FilterToken FilterToken::subtitle_tracks(std::vector<config::TrackSpec>&& tracks) {
		return track_list(Type::SubtitleTrackList, std::move(tracks));
	}

	std::optional<std::string_view> FilterToken::as_video_encoder() const {
		if(m_type != Type::VideoEncoderName) {
			return std::optional<std::string_view>();
		}

		return m_name;
	}

	std::optional<int16_t> FilterToken::as_quantizer() const {
		if(m_type != Type::Quantizer) {
			return std::optional<int16_t>();
		}

		return m_quantizer;
	}

	std::optional<uint8_t> FilterToken::as_speed() const {
		if(m_type != Type::Speed) {
			return std::optional<uint8_t>();
		}

		return m_small;
	}

	std::optional<config::Profile> FilterToken::as_profile() const {
		if(m_type != Type::Profile) {
			return std::optional<config::Profile>();
		}

		return m_profile;
	}

	std::optional<uint8_t> FilterToken::as_grain() const {
		if(m_type != Type::Grain) {
			return std::optional<uint8_t>();
		}

		return m_small;
	}

	std::optional<bool> FilterToken::as_compat() const {
		if(m_type != Type::Compat) {
			return std::optional<bool>();
		}

		return m_compat;
	}

	std::optional<std::string_view> FilterToken::as_extension() const {
		if(m_type != Type::Extension) {
			return std::optional<std::string_view>();
		}

		return m_name;
	}

	std::optional<uint8_t> FilterToken::as_bit_depth() const {
		if(m_type != Type::BitDepth) {
			return std::optional<uint8_t>();
		}

		return m_small;
	}

	std::optional<config::Resolution> FilterToken::as_resolution() const {
		if(m_type != Type::Resolution) {
			return std::optional<config::Resolution>();
		}

		return m_resolution;
	}

	std::optional<std::string_view> FilterToken::as_audio_encoder() const {
		if(m_type != Type::AudioEncoderName) {
			return std::optional<std::string_view>();
		}

		return m_name;
	}

	std::optional<uint32_t> FilterToken::as_audio_bitrate() const {
		if(m_type != Type::AudioBitrate) {
			return std::optional<uint32_t>();
		}

		return m_bitrate;
	}

	std::optional<std::span<const config::TrackSpec>> FilterToken::as_audio_tracks() const {
		if(m_type != Type::AudioTrackList) {
			return std::optional<std::span<const config::TrackSpec>>();
		}

		return std::span<const config::TrackSpec>(m_tracks);
	}

	bool FilterToken::is_audio_normalize() const {
		return m_type == Type::AudioNormalize;
	}

	std::optional<std::span<const config::TrackSpec>> FilterToken::as_subtitle_tracks() const {
		if(m_type != Type::SubtitleTrackList) {
			return std::optional<std::span<const config::TrackSpec>>();
		}

		return std::span<const config::TrackSpec>(m_tracks);
	}

	FilterToken::FilterToken(FilterToken&& t) {
		m_type = t.m_type;

		switch(t.m_type) {
			case Type::VideoEncoderName:
			case Type::Extension:
			case Type::AudioEncoderName:
				m_name = t.m_name;
				return;
			case Type::Quantizer:
				m_quantizer = t.m_quantizer;
				return;
			case Type::Speed:
			case Type::Grain:
			case Type::BitDepth:
				m_small = t.m_small;
				return;
			case Type::Profile:
				m_profile = t.m_profile;
				return;
			case Type::Compat:
				m_compat = t.m_compat;
				return;
			case Type::Resolution:
				m_resolution = t.m_resolution;
				return;
			case Type::AudioBitrate:
				m_bitrate = t.m_bitrate;
				return;
			case Type::AudioTrackList:
			case Type::SubtitleTrackList:
				std::construct_at(&m_tracks, std::move(t.m_tracks));
				return;
			case Type::AudioNormalize:
				return;
		}

		std::abort(); // unreachable
	}

	FilterToken::~FilterToken() {
		switch(m_type) {
			case Type::AudioTrackList:
			case Type::SubtitleTrackList:
				std::destroy_at(&m_tracks);
				break;
			default:
				break; // No destructor needed
		}
	}

	bool FilterToken::operator==(const FilterToken& rhs) const {
		if(m_type != rhs.m_type) {
			return false;
		}

		switch(m_type) {
			case Type::VideoEncoderName:
			case Type::Extension:
			case Type::AudioEncoderName:
				return m_name == rhs.m_name;
			case Type::Quantizer:
				return m_quantizer == rhs.m_quantizer;
			case Type::Speed:
			case Type::Grain:
			case Type::BitDepth:
				return m_small == rhs.m_small;
			case Type::Profile:
				return m_profile == rhs.m_profile;
			case Type::Compat:
				return m_compat == rhs.m_compat;
			case Type::Resolution:
				return m_resolution == rhs.m_resolution;
			case Type::AudioBitrate:
				return m_bitrate == rhs.m_bitrate;
			case Type::AudioTrackList:
			case Type::SubtitleTrackList:
				return m_tracks == rhs.m_tracks;
			case Type::AudioNormalize:
				return true;
		}

		std::abort(); // unreachable
	}
}
