/*
Copyright (c) 2025 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/assert.hpp"

namespace kittymix {

// A globally reachable slot for an RAII-managed service instance. The instance lives inside
// the stub returned by provide(), and the slot points at it for as long as the stub exists.
// Stubs nest: destroying a stub restores whichever instance was provided before it.
template<typename T>
class Service {
	class Stub;
public:
	// Construct the service in place. Keep the returned stub alive for as long as the service
	// should be reachable.
	template<typename... Args>
	[[nodiscard]] auto provide(Args&&... args) -> Stub
	{
		return Stub(*this, forward<Args>(args)...);
	}

	auto operator*() -> T& { return *ASSUME_VAL(handle); }
	auto operator->() -> T* { return ASSUME_VAL(handle); }

	// Check if an instance is currently provided.
	explicit operator bool() const { return handle != nullptr; }

private:
	class Stub {
	public:
		template<typename... Args>
		explicit Stub(Service<T>& service, Args&&... args):
			service{service},
			instance{forward<Args>(args)...},
			previous{exchange(service.handle, &instance)}
		{}

		~Stub() { service.handle = previous; }

		Stub(Stub const&) = delete;
		auto operator=(Stub const&) -> Stub& = delete;
		Stub(Stub&&) = delete;
		auto operator=(Stub&&) -> Stub& = delete;

	private:
		Service<T>& service;
		T instance;
		T* previous;
	};

	T* handle = nullptr;
};

}
