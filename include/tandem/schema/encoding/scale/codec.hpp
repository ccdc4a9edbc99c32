#pragma once
#include <tandem/schema/encoding/scale/audit_event_record.hpp>
#include <tandem/schema/encoding/scale/capability_state.hpp>
#include <tandem/schema/encoding/scale/encoder.hpp>
#include <tandem/schema/encoding/scale/management_state.hpp>
#include <tandem/schema/encoding/scale/registry_state.hpp>
#include <tandem/schema/encoding/scale/shared_account_state.hpp>
