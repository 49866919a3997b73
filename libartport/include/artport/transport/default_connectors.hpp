// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_TRANSPORT_DEFAULT_CONNECTORS_HPP
#define ARTPORT_TRANSPORT_DEFAULT_CONNECTORS_HPP

#include "artport/transport/connector.hpp"

namespace artport::transport
{
    /**
     * The connectors shipped with artport.
     *
     * - ``http`` serves ``http`` and ``https`` with basic, digest, and header authentication,
     * - ``sftp`` serves ``sftp`` with basic authentication,
     * - ``s3`` serves ``s3`` with AWS signatures,
     * - ``gcs`` serves ``gcs`` without configurable authentication.
     */
    [[nodiscard]] auto default_connectors() -> connector_list;

    [[nodiscard]] auto default_connector_provider() -> ConnectorProvider;
}
#endif
