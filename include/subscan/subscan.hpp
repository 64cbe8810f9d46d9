#pragma once

// Primary public header for the subscan subdomain discovery library.
// Most users should include this header only.

// Error & result model
#include <subscan/error.hpp>
#include <subscan/expected.hpp>
#include <subscan/result.hpp>
#include <subscan/log.hpp>

// Inputs & configuration
#include <subscan/domain.hpp>
#include <subscan/mode.hpp>
#include <subscan/scan_config.hpp>

// Candidate generation
#include <subscan/arrangement_cursor.hpp>
#include <subscan/generator.hpp>
#include <subscan/wordlists.hpp>

// Verification
#include <subscan/admission_gate.hpp>
#include <subscan/curl_https_probe.hpp>
#include <subscan/probe.hpp>
#include <subscan/resolv_dns_probe.hpp>
#include <subscan/scan_result.hpp>
#include <subscan/thread_pool.hpp>
#include <subscan/verifier.hpp>

// Driving client
#include <subscan/report.hpp>
#include <subscan/session.hpp>
