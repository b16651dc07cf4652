/*
 * Privacy Guard - Core Module
 * Copyright (C) 2025 Privacy Guard contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; for more details see the file
 * "LICENSE.GPL-3.0-or-later" in the distribution root.
 */

#pragma once

#include <stdexcept>

namespace PrivacyGuard::Core {

// Corrupt, unsupported or rejected image bytes. The batch skips the image.
class DecodeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class EncodeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Missing or incompatible model files. The registry moves on to the next backend.
class BackendLoadError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Failure during a single detection call. Only that capability of that image comes back empty.
class BackendInferenceError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace PrivacyGuard::Core
