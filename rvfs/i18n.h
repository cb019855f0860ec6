// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef I18N_H_2093847509128374650
#define I18N_H_2093847509128374650

#include <memory>
#include <mutex>
#include <string>


//minimal layer enabling text translation - without platform/library dependencies!

#define RVFS_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s) rvfs::translate(RVFS_TRANS_CONCAT_SUB(L, s))
//source and translation are required to use %x as placeholder


namespace rvfs
{
//implement handler to enable program-wide localizations:
struct TranslationHandler
{
    //THREAD-SAFETY: "const" member must model thread-safe access!
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    virtual std::wstring translate(const std::wstring& text) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();








//######################## implementation ##############################
namespace impl
{
struct GlobalTranslator
{
    std::mutex lock;
    std::shared_ptr<const TranslationHandler> handler;
};

inline GlobalTranslator& getGlobalTranslator()
{
    static GlobalTranslator inst; //lives until process end => translate() is safe from detached threads
    return inst;
}
}

inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    impl::GlobalTranslator& gt = impl::getGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    return gt.handler;
}


inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    impl::GlobalTranslator& gt = impl::getGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    gt.handler = std::move(newHandler);
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator()) //std::shared_ptr => temporarily take (shared) ownership while using the interface!
        return t->translate(text);
    return text;
}
}

#endif //I18N_H_2093847509128374650
