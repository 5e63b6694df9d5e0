/*
 *      Copyright (C) 2005-2008 Team XBMC
 *      http://www.xbmc.org
 *
 *  This Program is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2, or (at your option)
 *  any later version.
 *
 *  This Program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with XBMC; see the file COPYING.  If not, write to
 *  the Free Software Foundation, 675 Mass Ave, Cambridge, MA 02139, USA.
 *  http://www.gnu.org/copyleft/gpl.html
 *
 */

#include "WorkerThread.h"

#include <stdio.h>

#include "utils/log.h"

#ifdef CLASSNAME
#undef CLASSNAME
#endif
#define CLASSNAME "WorkerThread"

WorkerThread::WorkerThread()
{
  pthread_attr_init(&m_tattr);
  pthread_attr_setdetachstate(&m_tattr, PTHREAD_CREATE_JOINABLE);
  m_thread  = 0;
  m_running = false;
}

WorkerThread::~WorkerThread()
{
  if(m_running)
    Join();

  pthread_attr_destroy(&m_tattr);
}

bool WorkerThread::Join()
{
  if(!m_running)
  {
    CLogLog(LOGDEBUG, "%s::%s - No thread running", CLASSNAME, __func__);
    return false;
  }

  pthread_join(m_thread, nullptr);
  m_running = false;
  m_thread = 0;

  CLogLog(LOGDEBUG, "%s::%s - Thread stopped", CLASSNAME, __func__);
  return true;
}

bool WorkerThread::Create()
{
  if(m_running)
  {
    CLogLog(LOGERROR, "%s::%s - Thread already running", CLASSNAME, __func__);
    return false;
  }

  if(pthread_create(&m_thread, &m_tattr, &WorkerThread::Run, this) != 0)
  {
    CLogLog(LOGERROR, "%s::%s - pthread_create failed", CLASSNAME, __func__);
    return false;
  }

  m_running = true;
  CLogLog(LOGDEBUG, "%s::%s - Thread with id %lu started", CLASSNAME, __func__, (unsigned long)m_thread);
  return true;
}

void *WorkerThread::Run(void *arg)
{
  WorkerThread *thread = static_cast<WorkerThread *>(arg);
  thread->Process();

  CLogLog(LOGDEBUG, "%s::%s - Exited thread", CLASSNAME, __func__);
  return nullptr;
}
