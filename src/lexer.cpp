#include "src/lexer.hh"
#include "src/util.hh"

namespace encspec {
	template<typename P>
	std::optional<Spanned<std::string_view>> Lexer::take_while1(P predicate) {
		const size_t start = m_remaining_idx;

		while(m_remaining_idx < m_src.length() && predicate(m_src[m_remaining_idx])) {
			m_remaining_idx += 1;
		}

		if(m_remaining_idx == start) {
			return std::optional<Spanned<std::string_view>>();
		}

		const size_t len = m_remaining_idx - start;
		return Spanned(m_src.substr(start, len), Span(m_offset + start, len));
	}

	void Lexer::skip_whitespace() {
		while(m_remaining_idx < m_src.length() && is_space(m_src[m_remaining_idx])) {
			m_remaining_idx += 1;
		}
	}

	void Lexer::skip_separators() {
		skip_whitespace();

		while(m_remaining_idx < m_src.length() && m_src[m_remaining_idx] == ',') {
			m_remaining_idx += 1;
		}

		skip_whitespace();
	}

	std::optional<Span> Lexer::ch(char c) {
		if(empty() || m_src[m_remaining_idx] != c) {
			return std::optional<Span>();
		}

		m_remaining_idx += 1;
		return Span(position() - 1, 1);
	}

	std::optional<Span> Lexer::tag(std::string_view tag) {
		if(!remaining().starts_with(tag)) {
			return std::optional<Span>();
		}

		const size_t start = position();
		m_remaining_idx += tag.length();

		return span_from(start);
	}

	std::optional<Spanned<std::string_view>> Lexer::tag_any(std::initializer_list<std::string_view> tags) {
		for(std::string_view t : tags) {
			if(std::optional<Span> s = tag(t)) {
				return Spanned(t, *s);
			}
		}

		return std::optional<Spanned<std::string_view>>();
	}

	std::optional<Spanned<std::string_view>> Lexer::digit1() {
		return take_while1(is_digit);
	}

	std::optional<Spanned<std::string_view>> Lexer::alpha1() {
		return take_while1(is_alpha);
	}

	std::optional<Spanned<std::string_view>> Lexer::alnum1() {
		return take_while1(is_alnum);
	}

	std::optional<Spanned<std::string_view>> Lexer::signed_digits() {
		const size_t start = m_remaining_idx;

		if(!empty() && m_src[m_remaining_idx] == '-') {
			m_remaining_idx += 1;
		}

		if(!digit1()) {
			m_remaining_idx = start;
			return std::optional<Spanned<std::string_view>>();
		}

		const size_t len = m_remaining_idx - start;
		return Spanned(m_src.substr(start, len), Span(m_offset + start, len));
	}
}
