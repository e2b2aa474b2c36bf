#include "src/util.hh"

#include <cstdint>
#include <new>
#include <string>

extern "C" {
	#include <libavutil/hash.h>
}

namespace encspec {
	std::string indent(std::string&& input, size_t level) {
		if(input.empty()) {
			return std::move(input);
		}

		for(size_t i = input.length() - 1;;) {
			// Trailing newlines do not start a new line to indent
			if(input[i] == '\n' && i + 1 < input.length()) {
				for(size_t j = 0; j < level; j++) {
					input.insert(i + 1, "  ");
				}
			}

			if(i == 0) {
				break;
			} else {
				i--;
			}
		}

		for(size_t i = 0; i < level; i++) {
			input.insert(0, "  ");
		}

		return std::move(input);
	}

	Hasher::Hasher() {
		if(av_hash_alloc(&m_hasher, "SHA256") < 0) {
			throw std::bad_alloc();
		}
		av_hash_init(m_hasher);
	}

	void Hasher::add(uint8_t data) {
		Hasher::add(&data, sizeof(data));
	}

	void Hasher::add(uint16_t data) {
		data = htobe16(data);

		Hasher::add(&data, sizeof(data));
	}

	void Hasher::add(uint32_t data) {
		data = htobe32(data);

		Hasher::add(&data, sizeof(data));
	}

	void Hasher::add(uint64_t data) {
		data = htobe64(data);

		Hasher::add(&data, sizeof(data));
	}

	void Hasher::add(std::string_view string) {
		Hasher::add(string.data(), string.size());
	}

	void Hasher::add_field(std::string_view string) {
		Hasher::add(static_cast<uint64_t>(string.size()));
		Hasher::add(string);
	}

	void Hasher::add(const void *data, const size_t nbytes) {
		m_nbytes += nbytes;
		av_hash_update(m_hasher, (const uint8_t *) data, nbytes);
	}

	std::string Hasher::into_string() {
		std::string retval;
		retval.resize(45);

		av_hash_final_b64(m_hasher, (uint8_t *) retval.data(), retval.size());

		retval.resize(43);
		for(auto& c : retval) {
			switch(c) {
				case '+': c = '-'; break;
				case '/': c = '_'; break;
			}
		}

		return retval;
	}

	Hasher::~Hasher() {
		av_hash_freep(&m_hasher);
	}
}
