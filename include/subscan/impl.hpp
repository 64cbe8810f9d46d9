#pragma once

// Inline definitions. Include once per executable, next to the public headers it uses.

#include <subscan/impl/assert.ipp>
#include <subscan/impl/error.ipp>
#include <subscan/impl/log.ipp>

#include <subscan/impl/domain.ipp>
#include <subscan/impl/mode.ipp>
#include <subscan/impl/scan_config.ipp>

#include <subscan/impl/arrangement_cursor.ipp>
#include <subscan/impl/generator.ipp>

#include <subscan/impl/admission_gate.ipp>
#include <subscan/impl/thread_pool.ipp>

#include <subscan/impl/curl_https_probe.ipp>
#include <subscan/impl/resolv_dns_probe.ipp>
#include <subscan/impl/verifier.ipp>

#include <subscan/impl/report.ipp>
#include <subscan/impl/session.ipp>
