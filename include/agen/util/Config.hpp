#pragma once

#define AGEN_NODISCARD [[nodiscard]]
