#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace encspec {
	namespace ansi_escape {
		constexpr std::string_view BOLD    = "\x1b[1m";
		constexpr std::string_view UNBOLD  = "\x1b[22m";
		constexpr std::string_view RED_FG  = "\x1b[31m";
		constexpr std::string_view CYAN_FG = "\x1b[36m";
		constexpr std::string_view RESET   = "\x1b[m";
	}

	// Position in the specification string (byte offsets into the whole string, not into a segment).
	class Span {
		public:
			constexpr inline Span(size_t start, size_t length): start(start), length(length) {};
			constexpr Span span_after() const {return Span(start + length, 0);}
			constexpr size_t end() const {return start + length;}

			constexpr bool operator==(const Span&) const = default;

			size_t start;
			size_t length;

			Span() = delete;
	};

	typedef struct {
		size_t line;
		size_t column;
	} LineAndColumn;

	// Contains precomputed line and column information and a reference to the underlying specification.
	class SourceInfo {
		public:
			SourceInfo(std::string_view src);

			constexpr std::string_view src() const {return m_src;}

			// Gets the first byte index in a line
			std::size_t start_of_line(size_t line_no) const;

			LineAndColumn position_of(size_t byte_idx) const;
			std::array<LineAndColumn, 2> position_of(Span byte_span) const;
		private:
			// The byte indexes of where each line starts
			std::vector<size_t> m_line_start_indexes;
			std::string_view    m_src;
	};

	// An object with a `Span`.
	template <typename T>
	class Spanned {
		public:
			constexpr inline Spanned(T val, Span span): val(std::forward<T>(val)), span(span) {};
			T val;
			Span span;

			template<typename F>
			inline Spanned<std::invoke_result_t<F, const T&>> map(F f) const {
				return Spanned<std::invoke_result_t<F, const T&>>(f(val), span);
			}

			// Converts a `const Spanned<T>&` into a `Spanned<const T&>`
			constexpr Spanned<const T&> as_cref() const {
				return Spanned<const T&>(val, span);
			}

			constexpr const std::remove_cvref_t<T> *operator->() const {
				return &val;
			}

			constexpr std::add_lvalue_reference_t<std::add_const_t<T>> operator*() const {
				return val;
			}
	};

	// A message with one or more `Hint`s
	class Diagnostic {
		public:
			// Renders the diagnostic against the specification it was produced from.
			//
			// With `color` unset no ANSI escape sequences are emitted.
			std::string render(const SourceInfo& si, bool color = true) const;

			// A message that points to a snippet of the specification
			class Hint {
				public:
					Hint() = delete;
					static Hint error(std::string&& msg, Span span) {
						return Hint(
							std::move(msg),
							span,
							ansi_escape::RED_FG,
							'^'
						);
					}

					static Hint info(std::string&& msg, Span span) {
						return Hint(
							std::move(msg),
							span,
							ansi_escape::CYAN_FG,
							'-'
						);
					}

					std::string msg;
					Span span;

					// The ANSI escape sequence for the color that the hint should be rendered with
					std::string_view m_color;

					// The character that is rendered under the offending text
					char             m_pointer_char;
				private:
					Hint(std::string msg, Span span, std::string_view color, char pointer)
						: msg(std::move(msg)), span(span), m_color(color), m_pointer_char(pointer) {};
			};

			Diagnostic(std::string&& msg, std::vector<Hint> hints): m_msg(std::move(msg)), m_hints(std::move(hints)) {};

			std::string_view msg() const {
				return std::string_view(this->m_msg);
			}

			std::span<const Hint> hints() const {
				return m_hints;
			}

		private:
			std::string       m_msg;
			std::vector<Hint> m_hints;
	};

	enum struct ErrorKind {
		UnrecognizedFilter,
		UnknownEncoderName,
		UnknownAudioEncoderName,
		UnknownProfile,
		UnsupportedExtension,
		UnsupportedBitDepth,
		InvalidNumericLiteral,
		FilterValueOutOfRange,
		MissingTrackFile,
	};

	std::string_view ErrorKind_to_str(ErrorKind kind);

	// Inclusive bounds of a numeric filter value
	struct ValueRange {
		int64_t min;
		int64_t max;

		constexpr bool contains(int64_t v) const {return v >= min && v <= max;}
		constexpr bool operator==(const ValueRange&) const = default;
	};

	// The error thrown by every stage of specification parsing and resolution.
	//
	// Besides the renderable `Diagnostic`, it carries whatever structured payload applies to its kind:
	// - `FilterValueOutOfRange`: `filter`, `value` and `allowed_range`
	// - `InvalidNumericLiteral`: `filter` and `literal`
	// - `MissingTrackFile`: `path`
	// - `UnrecognizedFilter`: `literal` holds the unmatched remainder
	// - name errors: `literal` holds the rejected name
	class ParseError {
		public:
			ParseError(ErrorKind kind, Diagnostic&& diagnostic)
				: m_kind(kind)
				, m_diagnostic(std::move(diagnostic)) {}

			constexpr ErrorKind kind() const {return m_kind;}
			const Diagnostic& diagnostic() const {return m_diagnostic;}

			std::string render(const SourceInfo& si, bool color = true) const {
				return m_diagnostic.render(si, color);
			}

			std::string                          filter;
			std::string                          literal;
			std::optional<int64_t>               value;
			std::optional<ValueRange>            allowed_range;
			std::optional<std::filesystem::path> path;
		private:
			ErrorKind  m_kind;
			Diagnostic m_diagnostic;
	};
}
