#ifndef CONSERVER_H_
#define CONSERVER_H_

#include "fileio.h"
#include "acres.h"
#include "acsmartptr.h"

namespace dlbr
{
class IConnBase;

/**
 * Owner of the listening sockets and of the client connections accepted there.
 */
class DLBR_API conserver : public tLintRefcounted
{
public:
	virtual ~conserver() = default;
	//! Bind the configured addresses. @return False if no listener could be created
	virtual bool Setup() = 0;
	virtual void ReleaseConnection(IConnBase*) =0;
	//! Stop listening and drop all connections
	virtual void Abandon() =0;
	virtual size_t GetConnectionCount() =0;
	static lint_ptr<conserver> Create(acres& res);
};

}

#endif /*CONSERVER_H_*/
