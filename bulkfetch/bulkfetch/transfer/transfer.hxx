#pragma once

#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>
#include <bulkfetch/transfer/transfer-gate.hxx>
#include <bulkfetch/transfer/transfer-retry.hxx>
#include <bulkfetch/transfer/transfer-task.hxx>
#include <bulkfetch/transfer/transfer-scheduler.hxx>
