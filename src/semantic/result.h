#pragma once
#include "failure.h"
#include <expected>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;
