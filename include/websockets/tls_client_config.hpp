/*
   Part of the websockets project, under the MIT License
   SPDX-License-Identifier: MIT

   Copyright (c) 2024-2025 Mikhail Smirnov

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in all
   copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
   SOFTWARE.
*/

#pragma once

#include <cstdint> ///< for uint8_t
#include <filesystem> ///< for std::filesystem::path
#include <optional> ///< for std::nullopt, std::optional
#include <string> ///< for std::string
#include <vector> ///< for std::vector

namespace websockets
{

enum struct tls_version : uint8_t
{
   tls1_0 [[maybe_unused]],
   tls1_1 [[maybe_unused]],
   tls1_2 [[maybe_unused]],
   tls1_3 [[maybe_unused]],
};

struct tls_client_config final
{
   /// Both paths empty means the system default CA paths
   std::filesystem::path caDirectoryPath{};
   std::filesystem::path caFilePath{};
   /// Additional trusted roots, PEM encoded
   std::vector<std::string> rootCertificatesPem{};
   /// Client identity, PEM encoded files
   std::filesystem::path certificateChainFilePath{};
   std::filesystem::path privateKeyFilePath{};
   std::optional<tls_version> minVersion{std::nullopt,};
   std::optional<tls_version> maxVersion{std::nullopt,};
   bool verifyPeer{true,};
   bool verifyHostname{true,};
   bool useSni{true,};
};

}
