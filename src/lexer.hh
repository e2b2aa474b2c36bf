#pragma once

#include "src/error.hh"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace encspec {
	// Prefix-consuming cursor over one segment of a specification.
	//
	// Every recogniser either consumes a prefix and returns it, or consumes nothing and returns an
	// empty optional. Spans are relative to the whole specification string, not to the segment.
	class Lexer {
		public:
			constexpr inline Lexer(std::string_view segment, size_t offset = 0)
				: m_src(segment)
				, m_offset(offset)
				, m_remaining_idx(0)
			{}

			constexpr bool empty() const {return m_remaining_idx >= m_src.length();}
			constexpr std::string_view remaining() const {return m_src.substr(m_remaining_idx);}

			// Span covering everything that has not been consumed yet
			constexpr Span remaining_span() const {
				return Span(m_offset + m_remaining_idx, m_src.length() - m_remaining_idx);
			}

			// Absolute position of the cursor
			constexpr size_t position() const {return m_offset + m_remaining_idx;}

			// Moves the cursor back to a position returned by `position()`
			constexpr void rewind(size_t position) {m_remaining_idx = position - m_offset;}

			// Span from `start` (as returned by `position()`) to the cursor
			constexpr Span span_from(size_t start) const {return Span(start, position() - start);}

			// Text of an absolute span that lies within this segment
			constexpr std::string_view text(Span span) const {return m_src.substr(span.start - m_offset, span.length);}

			void skip_whitespace();

			// Skips whitespace, then any number of commas, then whitespace again
			void skip_separators();

			std::optional<Span> ch(char c);
			std::optional<Span> tag(std::string_view tag);

			// Tries each tag in order
			std::optional<Spanned<std::string_view>> tag_any(std::initializer_list<std::string_view> tags);

			std::optional<Spanned<std::string_view>> digit1();
			std::optional<Spanned<std::string_view>> alpha1();
			std::optional<Spanned<std::string_view>> alnum1();

			// Digits with an optional leading `-`
			std::optional<Spanned<std::string_view>> signed_digits();
		private:
			std::string_view m_src;
			size_t m_offset;
			size_t m_remaining_idx;

			template<typename P>
			std::optional<Spanned<std::string_view>> take_while1(P predicate);
	};
}
