/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

/**
 * @file result.h
 * @brief Result<T> error handling types for quicwire
 *
 * Every codec operation is fallible and reports failures through
 * Result<T> / VoidResult instead of exceptions. The only exception the
 * codec lets escape is std::bad_alloc.
 *
 * @code
 * auto encoded = quicwire::protocols::quic::varint::encode(value, buffer);
 * if (encoded.is_err()) {
 *     // encoded.error().code is one of error_codes::codec
 * }
 * @endcode
 */

#pragma once

#ifdef QUICWIRE_WITH_COMMON_SYSTEM
	#include <kcenon/common/patterns/result.h>
	#include <kcenon/common/error/error_codes.h>
#endif

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace quicwire {

namespace error_codes {
	// Wire codec errors
	namespace codec {
		constexpr int buffer_too_small = -700;
		constexpr int value_out_of_range = -701;
		constexpr int not_implemented = -702;
		constexpr int unknown_discriminator = -703;
		constexpr int invalid_prefix = -704;
		constexpr int malformed_field = -705;
		constexpr int packet_released = -706;
	}
}

#ifdef QUICWIRE_WITH_COMMON_SYSTEM
	// Use common_system Result<T> when available
	template<typename T>
	using Result = ::kcenon::common::Result<T>;

	using VoidResult = ::kcenon::common::VoidResult;

	using error_info = ::kcenon::common::error_info;

	namespace error_codes {
		namespace common_errors = ::kcenon::common::error::codes::common_errors;
	}

	template<typename T>
	inline Result<std::decay_t<T>> ok(T&& value) {
		return Result<std::decay_t<T>>(std::forward<T>(value));
	}

	inline VoidResult ok() {
		return VoidResult(std::monostate{});
	}

	template<typename T>
	inline Result<T> error(int code, const std::string& message,
	                      const std::string& source = "quicwire",
	                      const std::string& details = "") {
		return Result<T>(error_info(code, message, source, details));
	}

	inline VoidResult error_void(int code, const std::string& message,
	                            const std::string& source = "quicwire",
	                            const std::string& details = "") {
		return VoidResult(error_info(code, message, source, details));
	}

	inline std::string error_details(const error_info& err) {
		return err.details.value_or("");
	}

#else
	// Standalone Result<T> used when common_system is not available

	struct simple_error {
		int code;
		std::string message;
		std::string source;
		std::string details;

		simple_error(int c, std::string msg, std::string src = "", std::string det = "")
			: code(c), message(std::move(msg)), source(std::move(src)), details(std::move(det)) {}
	};

	template<typename T>
	class Result {
	public:
		Result(T&& val) : data_(std::move(val)) {}
		Result(const T& val) : data_(val) {}
		Result(const simple_error& err) : data_(err) {}

		bool is_ok() const { return std::holds_alternative<T>(data_); }
		bool is_err() const { return !is_ok(); }

		const T& value() const { return std::get<T>(data_); }
		T& value() { return std::get<T>(data_); }

		const simple_error& error() const { return std::get<simple_error>(data_); }

		explicit operator bool() const { return is_ok(); }

	private:
		std::variant<T, simple_error> data_;
	};

	using VoidResult = Result<std::monostate>;
	using error_info = simple_error;

	namespace error_codes {
		namespace common_errors {
			constexpr int success = 0;
			constexpr int invalid_argument = -1;
			constexpr int not_found = -2;
			constexpr int out_of_memory = -8;
			constexpr int io_error = -9;
			constexpr int network_error = -10;
			constexpr int internal_error = -99;
		}
	}

	template<typename T>
	inline Result<std::decay_t<T>> ok(T&& value) {
		return Result<std::decay_t<T>>(std::forward<T>(value));
	}

	inline VoidResult ok() {
		return VoidResult(std::monostate{});
	}

	template<typename T>
	inline Result<T> error(int code, const std::string& message,
	                      const std::string& source = "quicwire",
	                      const std::string& details = "") {
		return Result<T>(simple_error(code, message, source, details));
	}

	inline VoidResult error_void(int code, const std::string& message,
	                            const std::string& source = "quicwire",
	                            const std::string& details = "") {
		return VoidResult(simple_error(code, message, source, details));
	}

	inline std::string error_details(const error_info& err) {
		return err.details;
	}

#endif

	/**
	 * @brief Re-wrap the error of one Result as another Result type
	 *
	 * Keeps code, message and details; the source is replaced so the
	 * propagation path stays visible in logs.
	 */
	template<typename T, typename U>
	inline Result<T> forward_error(const Result<U>& failed, const std::string& source) {
		return error<T>(failed.error().code, failed.error().message, source,
		                error_details(failed.error()));
	}

} // namespace quicwire
