#ifndef SAGA_FRAMEWORK_SAGA_COMPENSATIONDESCRIPTOR_HPP
#define SAGA_FRAMEWORK_SAGA_COMPENSATIONDESCRIPTOR_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <string>
#include <vector>

namespace SagaFramework
{
  /// @brief Durable description of a compensation: which handler to run and its serialized arguments.
  ///
  /// The saga does not interpret descriptors. A host that needs the ledger to survive a restart persists
  /// Saga::GetDescriptors() and rebuilds the actions through CompensationHandlerRegistry.
  struct CompensationDescriptor
  {
    std::string HandlerId;
    std::vector<std::string> Arguments;

    bool operator==(const CompensationDescriptor& other) const = default;
  };
}

#endif
