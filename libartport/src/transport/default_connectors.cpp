// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artport/transport/default_connectors.hpp"

namespace artport::transport
{
    auto default_connectors() -> connector_list
    {
        using Auth = specs::AuthenticationKind;
        return {
            make_connector("http", { "http", "https" }, { Auth::basic, Auth::digest, Auth::http_header }),
            make_connector("sftp", { "sftp" }, { Auth::basic }),
            make_connector("s3", { "s3" }, { Auth::aws_signature }),
            make_connector("gcs", { "gcs" }, {}),
        };
    }

    auto default_connector_provider() -> ConnectorProvider
    {
        return &default_connectors;
    }
}
