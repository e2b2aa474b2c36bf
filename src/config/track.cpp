#include "src/config/track.hh"

#include <format>
#include <string>
#include <variant>

namespace encspec::config {
	std::string TrackSpec::to_string() const {
		std::string s = std::visit(Overloaded {
			[](const FromVideo& v) {return std::format("video track {}", v.index);},
			[](const External& e)  {return std::format("file {}", e.path.string());},
		}, source);

		if(enabled) {
			s += " [enabled]";
		}
		if(forced) {
			s += " [forced]";
		}

		return s;
	}

	void TrackSpec::hash(Hasher& hasher) const {
		hasher.add("_track_");
		const size_t start = hasher.pos();

		std::visit(Overloaded {
			[&](const FromVideo& v) {
				hasher.add(static_cast<uint8_t>('V'));
				hasher.add(v.index);
			},
			[&](const External& e) {
				hasher.add(static_cast<uint8_t>('E'));
				hasher.add_field(e.path.string());
			},
		}, source);

		hasher.add(enabled);
		hasher.add(forced);

		hasher.add(static_cast<uint64_t>(hasher.pos() - start));
	}
}
