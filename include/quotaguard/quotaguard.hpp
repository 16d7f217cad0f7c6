#pragma once

// QuotaGuard: cost-budget gate for metered language-model APIs
//
// Prices each completion request before it goes upstream, admits it against
// one shared spend ceiling, and charges the reconciled cost afterwards.

// Core
#include "quotaguard/types.hpp"
#include "quotaguard/exceptions.hpp"
#include "quotaguard/config.hpp"
#include "quotaguard/monitor.hpp"

// Pricing and accounting
#include "quotaguard/price_catalog.hpp"
#include "quotaguard/cost_calculator.hpp"
#include "quotaguard/budget_ledger.hpp"

// Request admission
#include "quotaguard/credentials.hpp"
#include "quotaguard/allow_list.hpp"
#include "quotaguard/tokenizer.hpp"
#include "quotaguard/upstream.hpp"
#include "quotaguard/admission_controller.hpp"
