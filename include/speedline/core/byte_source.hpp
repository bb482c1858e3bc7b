#pragma once

namespace speedline
{

// ============================================================================
// Byte Source Interface
// ============================================================================

// Producer side of an upload. Data, end, abort and error notifications flow
// from the transport into the accountant; these are the controls flowing back.
class byte_source
{
public:
    virtual ~byte_source() = default;

    // Stop delivering fragments. Fragments already read are not delivered.
    virtual void pause() = 0;

    // Terminate the inbound connection once any pending reply is flushed.
    virtual void destroy() = 0;
};

} // namespace speedline
