/*
 * LiveVault - Test Support
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace LiveVault::Tests {

/// A fresh directory under the system temp path, removed on destruction.
class TemporaryDirectory {
public:
	TemporaryDirectory()
	{
		static std::atomic<unsigned> counter{0};
		const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() /
			fmt::format("livevault-test-{}-{}", stamp, counter.fetch_add(1));
		std::filesystem::create_directories(path_);
	}

	~TemporaryDirectory()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	const std::filesystem::path &path() const noexcept { return path_; }

	std::filesystem::path writeFile(const std::filesystem::path &relative, std::string_view contents) const
	{
		const std::filesystem::path target = path_ / relative;
		std::filesystem::create_directories(target.parent_path());
		std::ofstream ofs(target, std::ios::binary);
		ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
		return target;
	}

private:
	std::filesystem::path path_;
};

} // namespace LiveVault::Tests
