#pragma once

#include <bulkfetch/http/http-types.hxx>
#include <bulkfetch/http/http-request.hxx>
#include <bulkfetch/http/http-response.hxx>
#include <bulkfetch/http/http-client.hxx>
