#include "src/config/output.hh"

#include <format>
#include <sstream>

namespace encspec::config {
	static std::string tracks_to_string(const std::vector<TrackSpec>& tracks) {
		if(tracks.empty()) {
			return "[]";
		}

		std::stringstream s;

		s << "[\n";
		for(const TrackSpec& t : tracks) {
			s << indent(t.to_string()) << ",\n";
		}
		s << "]";

		return std::move(s).str();
	}

	std::string OutputJobConfig::to_string() const {
		std::stringstream s;

		s
			<< "Output {\n"
			<< "  video: " << video.to_string() << ",\n"
			<< "  extension: " << output_extension << ",\n";

		if(bit_depth_override) {
			s << "  bit_depth: " << static_cast<int>(*bit_depth_override) << ",\n";
		}
		if(resolution_override) {
			s << std::format("  resolution: {}x{},\n", resolution_override->width, resolution_override->height);
		}

		s
			<< "  audio: " << audio.to_string() << ",\n"
			<< "  audio_normalize: " << (audio_normalize ? "true" : "false") << ",\n"
			<< "  audio_tracks: " << indent(tracks_to_string(audio_tracks)).substr(2) << ",\n"
			<< "  subtitle_tracks: " << indent(tracks_to_string(subtitle_tracks)).substr(2) << "\n"
			<< "}";

		return std::move(s).str();
	}

	void OutputJobConfig::hash(Hasher& hasher) const {
		hasher.add("_output-config_");
		const size_t start = hasher.pos();

		video.hash(hasher);
		hasher.add_field(output_extension);

		hasher.add(bit_depth_override.has_value());
		hasher.add(bit_depth_override.value_or(0));

		hasher.add(resolution_override.has_value());
		if(resolution_override) {
			hasher.add(resolution_override->width);
			hasher.add(resolution_override->height);
		}

		audio.hash(hasher);
		hasher.add(audio_normalize);

		hasher.add(static_cast<uint64_t>(audio_tracks.size()));
		for(const TrackSpec& t : audio_tracks) {
			t.hash(hasher);
		}

		hasher.add(static_cast<uint64_t>(subtitle_tracks.size()));
		for(const TrackSpec& t : subtitle_tracks) {
			t.hash(hasher);
		}

		hasher.add(static_cast<uint64_t>(hasher.pos() - start));
	}

	std::string OutputJobConfig::fingerprint() const {
		Hasher hasher;
		hash(hasher);

		return hasher.into_string();
	}
}
