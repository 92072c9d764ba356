// Copyright (c) 2026 atfs contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "entropy.h"
#include <kj/test.h>

namespace atfs {
namespace {

class ScriptedEntropy: public EntropySource {
  // Hands out the bytes of `script` in order, then zeros.

public:
  explicit ScriptedEntropy(kj::ArrayPtr<const kj::byte> script): script(script) {}

  uint calls = 0;

  void generate(kj::ArrayPtr<kj::byte> buffer) override {
    ++calls;
    for (kj::byte& b: buffer) {
      b = pos < script.size() ? script[pos++] : 0;
    }
  }

private:
  kj::ArrayPtr<const kj::byte> script;
  size_t pos = 0;
};

KJ_TEST("generateTempName() maps bytes onto [0-9A-Za-z]") {
  const kj::byte script[] = { 0, 9, 10, 35, 36, 61, 62, 247 };
  ScriptedEntropy entropy(script);

  auto name = generateTempName(".tmp.", ".tmp", entropy);
  KJ_EXPECT(name == ".tmp.09AZaz0z", name);
  KJ_EXPECT(entropy.calls == 1);
}

KJ_TEST("generateTempName() rejects biased bytes") {
  // 248 and above would make the first eight characters more likely than the rest.
  const kj::byte script[] = {
    255, 248, 1, 2, 3, 250, 4, 5, 6, 7, 252, 253, 254, 255, 249, 248,
    8
  };
  ScriptedEntropy entropy(script);

  auto name = generateTempName("", "", entropy);
  KJ_EXPECT(name == "12345678", name);
  KJ_EXPECT(entropy.calls == 2);
}

KJ_TEST("generateTempName() with system entropy") {
  auto& entropy = systemCsprng();
  auto a = generateTempName("pre-", "-post", entropy);
  auto b = generateTempName("pre-", "-post", entropy);

  KJ_EXPECT(a.size() == 4 + TEMP_NAME_RANDOM_CHARS + 5);
  KJ_EXPECT(a.startsWith("pre-"), a);
  KJ_EXPECT(a.endsWith("-post"), a);
  for (char c: kj::StringPtr(a).slice(4, 4 + TEMP_NAME_RANDOM_CHARS)) {
    KJ_EXPECT(('0' <= c && c <= '9') || ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z'), a);
  }

  // 62^8 possibilities; a collision here means the source is broken.
  KJ_EXPECT(a != b, a, b);
}

}  // namespace
}  // namespace atfs
