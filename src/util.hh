#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// 😭
#if defined(__linux__) && !defined (__ANDROID__)
#  include <endian.h>
#elif defined(__FreeBSD__) || defined(__NetBSD__)
#  include <sys/endian.h>
#elif defined(__OpenBSD__) || defined(__ANDROID__)
#  include <sys/types.h>
#elif defined(__WINDOWS__)
#  include <winsock2.h>
#  include <sys/param.h>
#  define htobe16(x) htons(x)
#  define htobe32(x) htonl(x)
#  define htobe64(x) htonll(x)
#else
#error "Unsupported platform"
#endif

extern "C" {
	#include <libavutil/hash.h>
}

namespace encspec {
	// Visitor built from a set of lambdas, for exhaustive `std::visit` matches.
	template<class... Ts>
	struct Overloaded : Ts... {
		using Ts::operator()...;
	};

	std::string indent(std::string&& input, size_t level = 1);

	// Whether `c` is treated as whitespace between clauses. Bytes of multi-byte UTF-8 sequences never are.
	constexpr bool is_space(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}

	constexpr bool is_digit(char c) {
		return c >= '0' && c <= '9';
	}

	constexpr bool is_alpha(char c) {
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
	}

	constexpr bool is_alnum(char c) {
		return is_alpha(c) || is_digit(c);
	}

	// SHA-256 over a stream of values, used for configuration fingerprints.
	class Hasher {
		public:
			Hasher();

			Hasher(const Hasher&) = delete;
			Hasher& operator=(const Hasher&) = delete;

			constexpr size_t pos() const {return m_nbytes;}

			void add(const void*data, size_t nbytes);
			void add(std::string_view string);
			void add(uint8_t data);
			void add(uint16_t data);
			void add(uint32_t data);
			void add(uint64_t data);

			inline void add(const char *string) {add(std::string_view(string));}
			inline void add(bool data)    {add(static_cast<uint8_t>(data));}
			inline void add(int8_t data)  {add(std::bit_cast<uint8_t >(data));}
			inline void add(int16_t data) {add(std::bit_cast<uint16_t>(data));}
			inline void add(int32_t data) {add(std::bit_cast<uint32_t>(data));}
			inline void add(int64_t data) {add(std::bit_cast<uint64_t>(data));}

			// Adds a length-prefixed string so that adjacent strings cannot run into each other
			void add_field(std::string_view string);

			// Gets the hash as a URL-safe BASE64 string.
			//
			// This will consume the underlying object. It is undefined behavior to do anything with this
			// object after this method has been called.
			std::string into_string();

			~Hasher();
		private:
			AVHashContext *m_hasher = nullptr;
			std::size_t m_nbytes = 0;
	};
}
